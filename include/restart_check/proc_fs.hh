#ifndef __RESTART_CHECK_PROC_FS_HH__
#define __RESTART_CHECK_PROC_FS_HH__

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace restart_check {

inline constexpr char kDefaultProcfsRoot[] = "/proc";

// Parses a decimal PID: digits only, 1..INT_MAX.
std::optional<pid_t> ParsePid(std::string_view text);

// Paths and queries on a process table rooted at a procfs mount.
class ProcFs {
public:
  explicit ProcFs(std::string root = kDefaultProcfsRoot);
  virtual ~ProcFs() = default;

  const std::string &Root() const { return root_; }

  std::string PidDir(pid_t pid) const;
  std::string ExePath(pid_t pid) const;
  std::string MapsPath(pid_t pid) const;
  // <root>/<pid>/map_files/<start>-<end>, addresses in unpadded hex
  std::string MapFilesPath(pid_t pid, uint64_t start_addr,
                           uint64_t end_addr) const;
  // `path` as seen from the process' root directory
  std::string RootedPath(pid_t pid, const std::string &path) const;

  // Reads the target of a symbolic link.
  // Returns: std::nullopt on failure, with errno set.
  virtual std::optional<std::string> ReadLink(const std::string &path) const;

  // True if the process' table entry is gone, i.e. the process exited
  // between enumeration and inspection.
  bool ProcessGone(pid_t pid) const;

  // Kernel threads have an exe entry that exists but cannot be resolved.
  bool IsKernelProcess(pid_t pid) const;

  // Numeric entries of the process table in directory order.
  // Returns: std::nullopt if the table cannot be read.
  std::optional<std::vector<pid_t>> ListPids() const;

private:
  std::string root_;
};

} // namespace restart_check

#endif
