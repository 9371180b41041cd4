#ifndef __RESTART_CHECK_SCOPED_FILE_HH__
#define __RESTART_CHECK_SCOPED_FILE_HH__

#include <cstddef>
#include <string>

namespace restart_check {

// Owns a file descriptor and closes it on destruction.
class ScopedFd {
public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd();

  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;
  ScopedFd(ScopedFd &&other) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;

  // Opens `path` with O_CLOEXEC added to `flags`. On failure the result is
  // not Valid() and errno is left as set by open(2).
  static ScopedFd Open(const std::string &path, int flags);

  bool Valid() const { return fd_ >= 0; }
  int Get() const { return fd_; }

private:
  void Reset();

  int fd_{-1};
};

// Owns a memory mapping and unmaps it on destruction.
class ScopedMapping {
public:
  ScopedMapping() = default;
  ScopedMapping(void *addr, size_t size) : addr_(addr), size_(size) {}
  ~ScopedMapping();

  ScopedMapping(const ScopedMapping &) = delete;
  ScopedMapping &operator=(const ScopedMapping &) = delete;
  ScopedMapping(ScopedMapping &&other) noexcept;
  ScopedMapping &operator=(ScopedMapping &&other) noexcept;

  // Maps the first `size` bytes of `fd` read-only and shared. On failure the
  // result is not Valid() and errno is left as set by mmap(2).
  static ScopedMapping MapReadOnly(int fd, size_t size);

  bool Valid() const { return addr_ != nullptr; }
  const void *Data() const { return addr_; }
  size_t Size() const { return size_; }

private:
  void Reset();

  void *addr_{nullptr};
  size_t size_{0};
};

} // namespace restart_check

#endif
