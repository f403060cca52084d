#include "exec/DryRunRunner.hpp"

namespace chkdefer::exec {

util::ProcessResult DryRunRunner::run(const Command& cmd) {
  if (cmd.kind == CommandKind::Query) return inner_.run(cmd);
  console_.line("[dry-run] " + display(cmd));
  util::ProcessResult r;
  r.launched = true;
  r.exit_code = 0;
  return r;
}

} // namespace chkdefer::exec
