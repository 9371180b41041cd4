#ifndef __RESTART_CHECK_REPORTER_HH__
#define __RESTART_CHECK_REPORTER_HH__

#include <ostream>
#include <string>
#include <sys/types.h>

namespace restart_check {

// Writes verdict lines to the result stream: "<pid>" in compact mode,
// "<pid>\t<path>" in verbose mode.
class Reporter {
public:
  Reporter(std::ostream &out, bool verbose) : out_(out), verbose_(verbose) {}

  void Report(pid_t pid, const std::string &path);

private:
  std::ostream &out_;
  const bool verbose_;
};

} // namespace restart_check

#endif
