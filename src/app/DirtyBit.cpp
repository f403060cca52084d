#include "app/DirtyBit.hpp"
#include "exec/Commands.hpp"
#include "util/Text.hpp"

namespace chkdefer::app {

bool has_dirty_marker(const std::string& output, const std::vector<std::string>& markers) {
  for (const auto& m : markers) {
    if (util::contains_icase(output, m)) return true;
  }
  return false;
}

bool DirtyBitInspector::is_dirty(const std::string& drive) {
  auto r = runner_.run(exec::dirty_query(drive));
  if (!r.launched) throw exec::ToolError("cannot query dirty bit of " + drive + ": " + r.error);
  if (r.exit_code != 0) {
    console_.warn("dirty bit query for " + drive + " exited with " + std::to_string(r.exit_code) +
                  "; treating the drive as clean");
  }
  return has_dirty_marker(r.output, markers_);
}

} // namespace chkdefer::app
