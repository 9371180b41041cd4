#include "proc_fs.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"
#include <cerrno>
#include <charconv>
#include <climits>
#include <cstring>
#include <dirent.h>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace restart_check {

std::optional<pid_t> ParsePid(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  int value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc() || end != text.data() + text.size() || value < 1) {
    return std::nullopt;
  }
  return static_cast<pid_t>(value);
}

ProcFs::ProcFs(std::string root) : root_(std::move(root)) {
  if (root_.empty()) {
    throw std::invalid_argument("Empty procfs root");
  }
  while (root_.size() > 1 && root_.back() == '/') {
    root_.pop_back();
  }
}

std::string ProcFs::PidDir(pid_t pid) const {
  return root_ + "/" + std::to_string(pid);
}

std::string ProcFs::ExePath(pid_t pid) const { return PidDir(pid) + "/exe"; }

std::string ProcFs::MapsPath(pid_t pid) const {
  return PidDir(pid) + "/maps";
}

std::string ProcFs::MapFilesPath(pid_t pid, uint64_t start_addr,
                                 uint64_t end_addr) const {
  return fmt::format("{}/map_files/{:x}-{:x}", PidDir(pid), start_addr,
                     end_addr);
}

std::string ProcFs::RootedPath(pid_t pid, const std::string &path) const {
  if (!path.empty() && path[0] == '/') {
    return PidDir(pid) + "/root" + path;
  }
  return PidDir(pid) + "/root/" + path;
}

std::optional<std::string> ProcFs::ReadLink(const std::string &path) const {
  std::vector<char> buffer(PATH_MAX);
  ssize_t size = readlink(path.c_str(), buffer.data(), buffer.size());
  if (size < 0) {
    return std::nullopt;
  }
  // readlink(2) truncates silently
  if (static_cast<size_t>(size) >= buffer.size()) {
    errno = ENAMETOOLONG;
    return std::nullopt;
  }
  return std::string(buffer.data(), static_cast<size_t>(size));
}

bool ProcFs::ProcessGone(pid_t pid) const {
  struct stat sb;
  if (stat(PidDir(pid).c_str(), &sb) == 0) {
    return false;
  }
  return errno == ENOENT || errno == ESRCH;
}

bool ProcFs::IsKernelProcess(pid_t pid) const {
  const std::string exe_path = ExePath(pid);
  char byte;
  // See https://stackoverflow.com/a/12231039/2217862.
  if (readlink(exe_path.c_str(), &byte, 1) < 0 && errno == ENOENT) {
    struct stat sb;
    return lstat(exe_path.c_str(), &sb) == 0;
  }
  return false;
}

std::optional<std::vector<pid_t>> ProcFs::ListPids() const {
  std::unique_ptr<DIR, int (*)(DIR *)> dir(opendir(root_.c_str()), closedir);
  if (!dir) {
    spdlog::error("{}: {}", root_, strerror(errno));
    return std::nullopt;
  }

  std::vector<pid_t> pids;
  errno = 0;
  while (dirent *entry = readdir(dir.get())) {
    if (auto pid = ParsePid(entry->d_name)) {
      pids.push_back(*pid);
    }
  }
  if (errno != 0) {
    spdlog::error("{}: {}", root_, strerror(errno));
    return std::nullopt;
  }
  return pids;
}

} // namespace restart_check
