#ifndef __RESTART_CHECK_SCAN_CONFIG_HH__
#define __RESTART_CHECK_SCAN_CONFIG_HH__

#include "effective_path.hh"
#include "pattern_filter.hh"
#include <string>
#include <vector>

namespace restart_check {

// Established once before a scan and shared read-only by every check.
struct ScanConfig {
  // Report every affected file of a process, not just its PID.
  bool verbose{false};
  // Treat EACCES on process metadata as "not affected" (unprivileged full
  // scan).
  bool ignore_permission_denied{false};
  PatternFilter filter;
  std::vector<std::string> rename_suffixes{kApkNewSuffix};
};

} // namespace restart_check

#endif
