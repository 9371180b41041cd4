#include "cli.hh"
#include "scan_driver.hh"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>
#include <map>

namespace restart_check {

namespace {
const CLI::Validator kPidValidator(
    [](std::string &input) -> std::string {
      if (ParsePid(input).has_value()) {
        return std::string();
      }
      return "Not a valid PID: " + input;
    },
    "PID", "PID");
} // namespace

void SetupLogging(const CliOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // Diagnostics never go to stdout, that's where the results are
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("%n: %v");
    sinks.push_back(console_sink);

    if (!options.log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, false);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(kProgramName, sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    std::exit(kExitScanError);
  }
}

void CreateCli(CLI::App &app, CliOptions &options) {
  app.name(kProgramName);
  app.description(
      "Find processes that use (map into memory) files which have been "
      "deleted or replaced on disk, and the new files are not identical to "
      "the mapped ones. If no PID is specified, scan all processes; if the "
      "effective UID is not 0, ignore processes we don't have permissions to "
      "examine.");
  app.footer("Please report bugs at "
             "<https://github.com/jirutka/apk-autoupdate/issues>");
  app.set_version_flag("-V,--version",
                       std::string(kProgramName) + " " RESTART_CHECK_VERSION,
                       "Print program version and exit");

  app.add_option("-f,--filter", options.file_patterns,
                 "Paths of mapped files to include/exclude from checking "
                 "(fnmatch(3) glob, leading \"!\" to exclude). May be "
                 "repeated; the first matching pattern decides.")
      ->allow_extra_args(false)
      ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
  app.add_flag("-v,--verbose", options.verbose,
               "Report all affected mapped files");
  app.add_option("-s,--rename-suffix", options.rename_suffixes,
                 "Suffix a package manager stages new files under, stripped "
                 "from deleted paths. May be repeated.")
      ->allow_extra_args(false)
      ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
      ->default_str(kApkNewSuffix);
  app.add_option("--procfs", options.procfs_root, "Root of the process table")
      ->check(CLI::ExistingDirectory)
      ->capture_default_str();
  app.add_option("-l,--log-file", options.log_file,
                 "Also write diagnostics to this file");
  app.add_option("--log-level", options.log_level,
                 "Log level (trace, debug, info, warn, error, critical)")
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));

  app.add_option("PID", options.pids, "Processes to scan (default: all)")
      ->check(kPidValidator);
}

ScanConfig MakeScanConfig(const CliOptions &options,
                          bool ignore_permission_denied) {
  ScanConfig config;
  config.verbose = options.verbose;
  config.ignore_permission_denied = ignore_permission_denied;
  config.filter = PatternFilter(options.file_patterns);
  config.rename_suffixes = options.rename_suffixes;
  return config;
}

} // namespace restart_check
