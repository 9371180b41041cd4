#include "cli.hh"
#include "file_compare.hh"
#include "proc_fs.hh"
#include "scan_driver.hh"
#include <CLI/CLI.hpp>
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <unistd.h>

int main(int argc, char *argv[]) {
  using namespace restart_check;

  CLI::App app;
  CliOptions options;
  CreateCli(app, options);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // --help and --version end up here too
    if (e.get_exit_code() == static_cast<int>(CLI::ExitCodes::Success)) {
      return app.exit(e);
    }
    (void)app.exit(e);
    std::cerr << app.help();
    return kExitWrongUsage;
  }

  SetupLogging(options);

  const bool scan_all = options.pids.empty();
  const ScanConfig config =
      MakeScanConfig(options, scan_all && geteuid() != 0);
  const ProcFs procfs(options.procfs_root);
  MmapFileComparator comparator;
  ScanDriver driver(config, procfs, comparator, std::cout);

  int status = scan_all ? driver.ScanAllProcesses()
                        : driver.ScanProcesses(options.pids);
  std::cout.flush();

  std::ostringstream stats;
  stats << driver.GetLastScanStats();
  spdlog::info("{}", stats.str());

  return status;
}
