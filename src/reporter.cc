#include "reporter.hh"

namespace restart_check {

void Reporter::Report(pid_t pid, const std::string &path) {
  if (verbose_) {
    out_ << pid << '\t' << path << '\n';
  } else {
    out_ << pid << '\n';
  }
}

} // namespace restart_check
