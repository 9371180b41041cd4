#include "scan_driver.hh"
#include "spdlog/spdlog.h"
#include <chrono>
#include <cstdlib>

namespace restart_check {

std::ostream &operator<<(std::ostream &os, const ScanStats &stats) {
  os << "Scan Statistics:\n"
     << "  Processes scanned:       " << stats.processes_scanned << "\n"
     << "  Processes affected:      " << stats.processes_affected << "\n"
     << "  Processes failed:        " << stats.processes_failed << "\n"
     << "  Kernel threads skipped:  " << stats.kernel_processes_skipped
     << "\n"
     << "  Files compared:          " << stats.files_compared << "\n"
     << "  Scan time:               " << stats.scan_time_ms << " ms";
  return os;
}

ScanDriver::ScanDriver(const ScanConfig &config, const ProcFs &procfs,
                       FileComparator &comparator, std::ostream &out)
    : procfs_(procfs), reporter_(out, config.verbose),
      checker_(config, procfs, comparator, reporter_) {}

bool ScanDriver::ScanOne(pid_t pid) {
  last_scan_stats_.processes_scanned++;

  CheckResult result = checker_.ScanProcess(pid);
  spdlog::debug("Process {}: {}", pid, ToString(result.verdict));
  if (result.verdict == Verdict::Affected) {
    last_scan_stats_.processes_affected++;
  }

  bool ok = result.verdict != Verdict::Error && !result.comparison_failed;
  if (!ok) {
    last_scan_stats_.processes_failed++;
  }
  return ok;
}

int ScanDriver::ScanProcesses(const std::vector<pid_t> &pids) {
  auto start_time = std::chrono::steady_clock::now();
  ResetStats();
  size_t compared_before = checker_.FilesCompared();

  int status = EXIT_SUCCESS;
  for (pid_t pid : pids) {
    if (!ScanOne(pid)) {
      status = kExitScanError;
    }
  }

  last_scan_stats_.files_compared = checker_.FilesCompared() - compared_before;
  last_scan_stats_.scan_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start_time)
          .count();
  return status;
}

int ScanDriver::ScanAllProcesses() {
  auto start_time = std::chrono::steady_clock::now();
  ResetStats();
  size_t compared_before = checker_.FilesCompared();

  auto pids = procfs_.ListPids();
  if (!pids.has_value()) {
    return kExitScanError;
  }
  if (pids->empty()) {
    spdlog::error("no processes found!");
    return kExitScanError;
  }

  int status = EXIT_SUCCESS;
  for (pid_t pid : *pids) {
    if (procfs_.IsKernelProcess(pid)) {
      spdlog::debug("Skipping kernel process {}", pid);
      last_scan_stats_.kernel_processes_skipped++;
      continue;
    }
    if (!ScanOne(pid)) {
      status = kExitScanError;
    }
  }

  last_scan_stats_.files_compared = checker_.FilesCompared() - compared_before;
  last_scan_stats_.scan_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start_time)
          .count();
  return status;
}

} // namespace restart_check
