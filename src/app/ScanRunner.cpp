#include "app/ScanRunner.hpp"
#include "exec/Commands.hpp"

namespace chkdefer::app {

int ScanRunner::scan(const std::string& drive) {
  auto r = runner_.run(exec::readonly_scan(drive));
  if (!r.launched) throw exec::ToolError("cannot run read-only check on " + drive + ": " + r.error);
  return r.exit_code;
}

} // namespace chkdefer::app
