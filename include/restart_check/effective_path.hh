#ifndef __RESTART_CHECK_EFFECTIVE_PATH_HH__
#define __RESTART_CHECK_EFFECTIVE_PATH_HH__

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restart_check {

// Appended by the kernel to a reported path whose inode was unlinked while
// still open.
inline constexpr std::string_view kDeletedMarker = " (deleted)";

// apk-tools stages a new file version under this suffix before renaming it.
inline constexpr char kApkNewSuffix[] = ".apk-new";

// Removes `suffix` from the end of `str`. Returns false (and leaves `str`
// untouched) if `str` does not end with it.
bool StripSuffix(std::string &str, std::string_view suffix);

// Turns a kernel-reported path (or a whole maps line, whose path is the last
// field) into the path that should now be on disk: strips the deletion
// marker, then the first matching rename suffix.
// Returns: std::nullopt if `reported` does not carry the deletion marker.
std::optional<std::string>
EffectivePath(std::string reported,
              const std::vector<std::string> &rename_suffixes);

} // namespace restart_check

#endif
