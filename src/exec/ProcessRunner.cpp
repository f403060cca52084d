#include "exec/ProcessRunner.hpp"

#include <cstdio>

namespace chkdefer::exec {

util::ProcessResult ProcessRunner::run(const Command& cmd) {
  auto r = util::run_process(cmd.argv, cmd.stdin_data);
  if (verbose_) {
    if (r.launched) {
      std::fprintf(stderr, "chkdefer: ProcessRunner: [%s] %s -> exit %d\n",
                   cmd.label.c_str(), display(cmd).c_str(), r.exit_code);
    } else {
      std::fprintf(stderr, "chkdefer: ProcessRunner: [%s] %s -> not started: %s\n",
                   cmd.label.c_str(), display(cmd).c_str(), r.error.c_str());
    }
  }
  return r;
}

} // namespace chkdefer::exec
