#ifndef __RESTART_CHECK_PATTERN_FILTER_HH__
#define __RESTART_CHECK_PATTERN_FILTER_HH__

#include <string>
#include <vector>

namespace restart_check {

// A fnmatch(3) glob, optionally negated by a leading '!'.
struct FilePattern {
  std::string glob;
  bool negated{false};

  static FilePattern Parse(const std::string &expression);
};

// Ordered list of include/exclude globs. The first glob that matches a path
// decides; a path no glob matches is excluded. An empty filter passes
// everything.
class PatternFilter {
public:
  PatternFilter() = default;
  explicit PatternFilter(const std::vector<std::string> &expressions);

  bool Matches(const std::string &path) const;

  bool Empty() const { return patterns_.empty(); }
  const std::vector<FilePattern> &Patterns() const { return patterns_; }

private:
  std::vector<FilePattern> patterns_;
};

} // namespace restart_check

#endif
