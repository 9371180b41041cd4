#ifndef __RESTART_CHECK_PROCESS_CHECKER_HH__
#define __RESTART_CHECK_PROCESS_CHECKER_HH__

#include "file_compare.hh"
#include "proc_fs.hh"
#include "reporter.hh"
#include "scan_config.hh"
#include <cstddef>
#include <string>
#include <sys/types.h>
#include <vector>

namespace restart_check {

enum class Verdict { NotAffected, Affected, Error };

const char *ToString(Verdict verdict);

struct CheckResult {
  Verdict verdict{Verdict::NotAffected};
  // Effective paths reported for the process
  std::vector<std::string> paths;
  // A candidate was reported as affected because its comparison failed
  bool comparison_failed{false};
};

/**
 * @brief Finds deleted or replaced files still in use by a process
 *
 * @details A process is checked twice: its running executable through
 * /proc/<pid>/exe, then every file-backed mapping listed in /proc/<pid>/maps.
 * Only paths the kernel marks as deleted are candidates. A candidate that
 * passes the pattern filter is compared against the original, which stays
 * reachable through procfs while the process keeps it open; identical
 * replacements are ignored.
 *
 * Each affected file is written to the Reporter as soon as it is found. In
 * compact mode a process is reported at most once.
 */
class ProcessChecker {
public:
  ProcessChecker(const ScanConfig &config, const ProcFs &procfs,
                 FileComparator &comparator, Reporter &reporter);

  // Non-copyable
  ProcessChecker(const ProcessChecker &) = delete;
  ProcessChecker &operator=(const ProcessChecker &) = delete;

  CheckResult CheckExecutable(pid_t pid);

  // skip_paths: paths already reported for this process
  CheckResult CheckMappedFiles(pid_t pid,
                               const std::vector<std::string> &skip_paths = {});

  // Executable first; mappings unless compact mode already found the process
  // affected.
  CheckResult ScanProcess(pid_t pid);

  size_t FilesCompared() const { return files_compared_; }

private:
  // Maps a failed read of process metadata to a verdict.
  CheckResult HandleInspectionFailure(pid_t pid, const std::string &path,
                                      int error) const;
  CompareResult Compare(const std::string &current_path,
                        const std::string &original_path);

  const ScanConfig &config_;
  const ProcFs &procfs_;
  FileComparator &comparator_;
  Reporter &reporter_;
  size_t files_compared_{0};
};

} // namespace restart_check

#endif
