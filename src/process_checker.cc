#include "process_checker.hh"
#include "effective_path.hh"
#include "maps_entry.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

namespace restart_check {

const char *ToString(Verdict verdict) {
  switch (verdict) {
  case Verdict::NotAffected:
    return "not affected";
  case Verdict::Affected:
    return "affected";
  case Verdict::Error:
    return "error";
  }
  __builtin_unreachable();
}

ProcessChecker::ProcessChecker(const ScanConfig &config, const ProcFs &procfs,
                               FileComparator &comparator, Reporter &reporter)
    : config_(config), procfs_(procfs), comparator_(comparator),
      reporter_(reporter) {}

CheckResult ProcessChecker::HandleInspectionFailure(pid_t pid,
                                                    const std::string &path,
                                                    int error) const {
  if (error == EACCES && config_.ignore_permission_denied) {
    spdlog::debug("{}: {}, skipping", path, strerror(error));
    return {};
  }
  // If process does not exist anymore, then it's not an error.
  if (procfs_.ProcessGone(pid)) {
    spdlog::debug("Process {} exited during inspection", pid);
    return {};
  }
  spdlog::error("{}: {}", path, strerror(error));
  CheckResult result;
  result.verdict = Verdict::Error;
  return result;
}

CompareResult ProcessChecker::Compare(const std::string &current_path,
                                      const std::string &original_path) {
  files_compared_++;
  CompareResult result = comparator_.Compare(current_path, original_path);
  spdlog::trace("{} vs {}: {}", current_path, original_path,
                ToString(result));
  return result;
}

/**
 * @brief Checks whether the running executable was deleted or replaced
 *
 * The exe link of a process whose binary was unlinked reads
 * "<path> (deleted)". The original binary stays readable through the link
 * itself, so it is compared with the file now at <path> in the process' root
 * directory.
 *
 * @return Affected unless the link is intact, the path is filtered out or the
 *         file on disk is byte-for-byte identical; Error only if the link
 *         cannot be read for a reason other than a tolerated permission
 *         problem or the process having exited.
 */
CheckResult ProcessChecker::CheckExecutable(pid_t pid) {
  const std::string exe_path = procfs_.ExePath(pid);

  auto link_path = procfs_.ReadLink(exe_path);
  if (!link_path.has_value()) {
    int link_err = errno;
    return HandleInspectionFailure(pid, exe_path, link_err);
  }

  auto effective = EffectivePath(std::move(*link_path), config_.rename_suffixes);
  if (!effective.has_value()) {
    return {};
  }
  if (!config_.filter.Matches(*effective)) {
    return {};
  }

  CompareResult compared =
      Compare(procfs_.RootedPath(pid, *effective), exe_path);
  if (compared == CompareResult::Identical) {
    return {};
  }

  CheckResult result;
  result.verdict = Verdict::Affected;
  result.comparison_failed = compared == CompareResult::Error;
  result.paths.push_back(*effective);
  reporter_.Report(pid, *effective);
  return result;
}

CheckResult
ProcessChecker::CheckMappedFiles(pid_t pid,
                                 const std::vector<std::string> &skip_paths) {
  const std::string maps_path = procfs_.MapsPath(pid);

  errno = 0;
  std::ifstream maps(maps_path);
  if (!maps) {
    int open_err = errno != 0 ? errno : EIO;
    return HandleInspectionFailure(pid, maps_path, open_err);
  }

  CheckResult result;
  std::string last_path;
  std::string line;
  while (std::getline(maps, line)) {
    // Cheap test first, most mappings are not deleted.
    auto stripped = EffectivePath(line, config_.rename_suffixes);
    if (!stripped.has_value()) {
      continue;
    }

    auto entry = ParseMapsLine(*stripped);
    if (!entry.has_value()) {
      spdlog::debug("{}: skipping malformed line '{}'", maps_path, line);
      continue;
    }

    // One file is typically mapped several times in a row with different
    // perms.
    if (entry->path == last_path) {
      continue;
    }
    last_path = entry->path;

    if (!entry->IsFileBacked()) {
      continue;
    }
    if (!config_.filter.Matches(entry->path)) {
      continue;
    }
    if (std::find(skip_paths.begin(), skip_paths.end(), entry->path) !=
        skip_paths.end()) {
      continue;
    }

    CompareResult compared = Compare(
        entry->path,
        procfs_.MapFilesPath(pid, entry->start_addr, entry->end_addr));
    if (compared == CompareResult::Identical) {
      continue;
    }

    result.verdict = Verdict::Affected;
    result.comparison_failed |= compared == CompareResult::Error;
    result.paths.push_back(entry->path);
    reporter_.Report(pid, entry->path);

    if (!config_.verbose) {
      break;
    }
  }

  return result;
}

CheckResult ProcessChecker::ScanProcess(pid_t pid) {
  CheckResult exe = CheckExecutable(pid);
  if (exe.verdict == Verdict::Error) {
    return exe;
  }
  if (exe.verdict == Verdict::Affected && !config_.verbose) {
    return exe;
  }

  // The executable is mapped too, don't report it twice.
  CheckResult maps = CheckMappedFiles(pid, exe.paths);
  maps.paths.insert(maps.paths.begin(), exe.paths.begin(), exe.paths.end());
  maps.comparison_failed |= exe.comparison_failed;
  if (maps.verdict == Verdict::NotAffected) {
    maps.verdict = exe.verdict;
  }
  return maps;
}

} // namespace restart_check
