#ifndef __RESTART_CHECK_SCAN_DRIVER_HH__
#define __RESTART_CHECK_SCAN_DRIVER_HH__

#include "process_checker.hh"
#include <cstdint>
#include <ostream>
#include <vector>

namespace restart_check {

constexpr int kExitScanError = 1;
constexpr int kExitWrongUsage = 100;

// Statistics about the most recent scan
struct ScanStats {
  uint64_t processes_scanned{0};
  uint64_t processes_affected{0};
  uint64_t processes_failed{0};
  uint64_t kernel_processes_skipped{0};
  uint64_t files_compared{0};
  int64_t scan_time_ms{0};
  friend std::ostream &operator<<(std::ostream &os, const ScanStats &stats);
};

// Runs ProcessChecker over a set of PIDs and folds the verdicts into an exit
// status. A failing PID never stops the scan.
class ScanDriver {
public:
  ScanDriver(const ScanConfig &config, const ProcFs &procfs,
             FileComparator &comparator, std::ostream &out);

  // Non-copyable
  ScanDriver(const ScanDriver &) = delete;
  ScanDriver &operator=(const ScanDriver &) = delete;

  // Scans exactly `pids`, in order, without kernel-thread filtering.
  int ScanProcesses(const std::vector<pid_t> &pids);

  // Scans every process in the process table except kernel threads.
  int ScanAllProcesses();

  const ScanStats &GetLastScanStats() const { return last_scan_stats_; }
  void ResetStats() { last_scan_stats_ = ScanStats(); }

private:
  // Returns false if the process counts towards the scan-error status.
  bool ScanOne(pid_t pid);

  const ProcFs &procfs_;
  Reporter reporter_;
  ProcessChecker checker_;
  ScanStats last_scan_stats_;
};

} // namespace restart_check

#endif
