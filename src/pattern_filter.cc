#include "pattern_filter.hh"
#include <fnmatch.h>

namespace restart_check {

FilePattern FilePattern::Parse(const std::string &expression) {
  FilePattern pattern;
  pattern.negated = !expression.empty() && expression[0] == '!';
  pattern.glob = pattern.negated ? expression.substr(1) : expression;
  return pattern;
}

PatternFilter::PatternFilter(const std::vector<std::string> &expressions) {
  patterns_.reserve(expressions.size());
  for (const auto &expression : expressions) {
    patterns_.push_back(FilePattern::Parse(expression));
  }
}

bool PatternFilter::Matches(const std::string &path) const {
  if (patterns_.empty()) {
    return true;
  }
  for (const auto &pattern : patterns_) {
    if (fnmatch(pattern.glob.c_str(), path.c_str(), 0) == 0) {
      return !pattern.negated;
    }
  }
  return false;
}

} // namespace restart_check
