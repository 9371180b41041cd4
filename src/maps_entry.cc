#include "maps_entry.hh"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace restart_check {

namespace {
// Parses the whole of `text` as an unsigned number in `base`.
bool ParseNumber(const std::string &text, int base, uint64_t &value) {
  if (text.empty() || !std::isxdigit(static_cast<unsigned char>(text[0]))) {
    return false;
  }
  try {
    size_t consumed = 0;
    value = std::stoull(text, &consumed, base);
    return consumed == text.size();
  } catch (const std::exception &) {
    return false;
  }
}
} // namespace

std::optional<MapEntry> ParseMapsLine(const std::string &line) {
  std::istringstream iss(line);
  std::string addr_range;
  std::string perms;
  std::string offset;
  std::string dev;
  std::string inode;

  if (!(iss >> addr_range >> perms >> offset >> dev >> inode)) {
    return {};
  }
  if (perms.size() != 4) {
    return {};
  }
  size_t dash_pos = addr_range.find('-');
  size_t colon_pos = dev.find(':');
  if (dash_pos == std::string::npos || colon_pos == std::string::npos) {
    return {};
  }

  MapEntry entry;
  uint64_t dev_major = 0;
  if (!ParseNumber(addr_range.substr(0, dash_pos), 16, entry.start_addr) ||
      !ParseNumber(addr_range.substr(dash_pos + 1), 16, entry.end_addr) ||
      !ParseNumber(dev.substr(0, colon_pos), 16, dev_major) ||
      !ParseNumber(inode, 10, entry.inode)) {
    return {};
  }
  entry.dev_major = static_cast<unsigned int>(dev_major);
  if (entry.start_addr >= entry.end_addr) {
    return {};
  }

  // Mapping path is the rest of the line, it may contain spaces.
  std::getline(iss, entry.path);
  entry.path.erase(0, entry.path.find_first_not_of(" \t"));
  if (entry.path.empty()) {
    return {};
  }

  return entry;
}

} // namespace restart_check
