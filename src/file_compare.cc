#include "file_compare.hh"
#include "scoped_file.hh"
#include "spdlog/spdlog.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

namespace restart_check {

const char *ToString(CompareResult result) {
  switch (result) {
  case CompareResult::Identical:
    return "identical";
  case CompareResult::Different:
    return "different";
  case CompareResult::Error:
    return "error";
  }
  __builtin_unreachable();
}

CompareResult MmapFileComparator::Compare(const std::string &current_path,
                                          const std::string &original_path) {
  ScopedFd current = ScopedFd::Open(current_path, O_RDONLY);
  if (!current.Valid()) {
    spdlog::error("{}: {}", current_path, strerror(errno));
    return CompareResult::Error;
  }

  ScopedFd original = ScopedFd::Open(original_path, O_RDONLY);
  if (!original.Valid()) {
    spdlog::error("{}: {}", original_path, strerror(errno));
    return CompareResult::Error;
  }

  struct stat current_sb;
  struct stat original_sb;
  if (fstat(current.Get(), &current_sb) < 0) {
    spdlog::error("{}: {}", current_path, strerror(errno));
    return CompareResult::Error;
  }
  if (fstat(original.Get(), &original_sb) < 0) {
    spdlog::error("{}: {}", original_path, strerror(errno));
    return CompareResult::Error;
  }
  if (current_sb.st_size != original_sb.st_size) {
    return CompareResult::Different;
  }

  const auto size = static_cast<size_t>(current_sb.st_size);
  // mmap(2) rejects a zero length.
  if (size == 0) {
    return CompareResult::Identical;
  }

  ScopedMapping current_map = ScopedMapping::MapReadOnly(current.Get(), size);
  if (!current_map.Valid()) {
    spdlog::error("{}: {}", current_path, strerror(errno));
    return CompareResult::Error;
  }
  ScopedMapping original_map = ScopedMapping::MapReadOnly(original.Get(), size);
  if (!original_map.Valid()) {
    spdlog::error("{}: {}", original_path, strerror(errno));
    return CompareResult::Error;
  }

  return std::memcmp(current_map.Data(), original_map.Data(), size) == 0
             ? CompareResult::Identical
             : CompareResult::Different;
}

} // namespace restart_check
