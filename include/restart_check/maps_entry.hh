#ifndef __RESTART_CHECK_MAPS_ENTRY_HH__
#define __RESTART_CHECK_MAPS_ENTRY_HH__

#include <cstdint>
#include <optional>
#include <string>

namespace restart_check {

// Selected fields of one /proc/<pid>/maps line.
struct MapEntry {
  uint64_t start_addr{0};
  uint64_t end_addr{0};
  unsigned int dev_major{0};
  uint64_t inode{0};
  std::string path;

  // Anonymous memory and device buffers (/SYSV00000000, /drm, /i915, ...)
  // have inode 0 or device major 0.
  bool IsFileBacked() const { return inode != 0 && dev_major != 0; }
};

// Parse a single line of a maps table:
//   <start>-<end> <perms> <offset> <major>:<minor> <inode> <path>
// Returns: std::nullopt if a field is missing or malformed, the path is empty
// or start >= end.
std::optional<MapEntry> ParseMapsLine(const std::string &line);

} // namespace restart_check

#endif
