#include "effective_path.hh"

namespace restart_check {

bool StripSuffix(std::string &str, std::string_view suffix) {
  if (str.size() < suffix.size()) {
    return false;
  }
  if (str.compare(str.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return false;
  }
  str.resize(str.size() - suffix.size());
  return true;
}

std::optional<std::string>
EffectivePath(std::string reported,
              const std::vector<std::string> &rename_suffixes) {
  // No marker means the file was neither deleted nor replaced.
  if (!StripSuffix(reported, kDeletedMarker)) {
    return std::nullopt;
  }
  for (const auto &suffix : rename_suffixes) {
    if (!suffix.empty() && StripSuffix(reported, suffix)) {
      break;
    }
  }
  return reported;
}

} // namespace restart_check
