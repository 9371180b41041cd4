#include "scoped_file.hh"
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>
#include <utility>

namespace restart_check {

ScopedFd::~ScopedFd() { Reset(); }

ScopedFd::ScopedFd(ScopedFd &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

ScopedFd &ScopedFd::operator=(ScopedFd &&other) noexcept {
  if (this != &other) {
    Reset();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

ScopedFd ScopedFd::Open(const std::string &path, int flags) {
  return ScopedFd(open(path.c_str(), flags | O_CLOEXEC));
}

void ScopedFd::Reset() {
  if (fd_ >= 0) {
    (void)close(fd_);
    fd_ = -1;
  }
}

ScopedMapping::~ScopedMapping() { Reset(); }

ScopedMapping::ScopedMapping(ScopedMapping &&other) noexcept
    : addr_(std::exchange(other.addr_, nullptr)),
      size_(std::exchange(other.size_, 0)) {}

ScopedMapping &ScopedMapping::operator=(ScopedMapping &&other) noexcept {
  if (this != &other) {
    Reset();
    addr_ = std::exchange(other.addr_, nullptr);
    size_ = std::exchange(other.size_, 0);
  }
  return *this;
}

ScopedMapping ScopedMapping::MapReadOnly(int fd, size_t size) {
  void *addr = mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
  if (addr == MAP_FAILED) {
    return ScopedMapping();
  }
  return ScopedMapping(addr, size);
}

void ScopedMapping::Reset() {
  if (addr_ != nullptr) {
    (void)munmap(addr_, size_);
    addr_ = nullptr;
    size_ = 0;
  }
}

} // namespace restart_check
