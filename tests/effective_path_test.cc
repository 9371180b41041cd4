#include "restart_check/effective_path.hh"

#include <gtest/gtest.h>

namespace restart_check {
namespace {

const std::vector<std::string> kApkSuffixes{kApkNewSuffix};

TEST(StripSuffixTest, StripsOnlyTrailingSuffix) {
  std::string str = "/usr/bin/foo (deleted)";
  EXPECT_TRUE(StripSuffix(str, " (deleted)"));
  EXPECT_EQ(str, "/usr/bin/foo");

  EXPECT_FALSE(StripSuffix(str, " (deleted)"));
  EXPECT_EQ(str, "/usr/bin/foo");
}

TEST(StripSuffixTest, SuffixLongerThanString) {
  std::string str = "ab";
  EXPECT_FALSE(StripSuffix(str, "xab"));
  EXPECT_EQ(str, "ab");
}

TEST(EffectivePathTest, IntactPathIsNotACandidate) {
  EXPECT_FALSE(EffectivePath("/usr/bin/foo", kApkSuffixes).has_value());
  // The marker has to be at the very end.
  EXPECT_FALSE(
      EffectivePath("/usr/bin/foo (deleted) x", kApkSuffixes).has_value());
}

TEST(EffectivePathTest, StripsDeletedMarker) {
  auto path = EffectivePath("/usr/bin/foo (deleted)", kApkSuffixes);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, "/usr/bin/foo");
}

TEST(EffectivePathTest, StripsRenameSuffixAfterMarker) {
  auto path =
      EffectivePath("/usr/lib/libx.so.1.2.3.apk-new (deleted)", kApkSuffixes);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, "/usr/lib/libx.so.1.2.3");
}

TEST(EffectivePathTest, RenameSuffixAloneIsNotACandidate) {
  EXPECT_FALSE(
      EffectivePath("/usr/lib/libx.so.apk-new", kApkSuffixes).has_value());
}

TEST(EffectivePathTest, ConfigurableSuffixes) {
  const std::vector<std::string> suffixes{".dpkg-new", ".rpmnew"};
  auto path = EffectivePath("/usr/bin/foo.rpmnew (deleted)", suffixes);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, "/usr/bin/foo");

  // Only the configured suffixes are stripped.
  path = EffectivePath("/usr/bin/foo.apk-new (deleted)", suffixes);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, "/usr/bin/foo.apk-new");
}

TEST(EffectivePathTest, WorksOnWholeMapsLine) {
  auto line = EffectivePath(
      "7f00-7f10 r-xp 00000000 08:01 42 /usr/lib/libx.so.apk-new (deleted)",
      kApkSuffixes);
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(*line, "7f00-7f10 r-xp 00000000 08:01 42 /usr/lib/libx.so");
}

} // namespace
} // namespace restart_check

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
