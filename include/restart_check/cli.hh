#ifndef __RESTART_CHECK_CLI_HH__
#define __RESTART_CHECK_CLI_HH__
#include "CLI/App.hpp"
#include "proc_fs.hh"
#include "scan_config.hh"
#include "spdlog/common.h"
#include <string>
#include <sys/types.h>
#include <vector>

#ifndef RESTART_CHECK_VERSION
#define RESTART_CHECK_VERSION "unknown"
#endif

namespace restart_check {

inline constexpr char kProgramName[] = "procs-need-restart";

struct CliOptions {
  bool verbose{false};
  std::vector<std::string> file_patterns;
  std::vector<std::string> rename_suffixes{kApkNewSuffix};
  std::string procfs_root{kDefaultProcfsRoot};
  std::vector<pid_t> pids;
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::warn};
};

void CreateCli(CLI::App &app, CliOptions &options);
void SetupLogging(const CliOptions &options);

// ignore_permission_denied: set for a full scan by an unprivileged user
ScanConfig MakeScanConfig(const CliOptions &options,
                          bool ignore_permission_denied);

} // namespace restart_check
#endif
