#include "app/DriveInventory.hpp"
#include "exec/Commands.hpp"
#include "util/DriveLetter.hpp"
#include "util/Text.hpp"

#include <algorithm>

namespace chkdefer::app {

auto parse_drive_list(const std::string& output) -> std::vector<std::string> {
  std::vector<std::string> drives;
  for (const auto& line : util::split_lines(output)) {
    auto d = util::normalize_drive(line);
    if (!d) continue;
    if (std::find(drives.begin(), drives.end(), *d) == drives.end()) drives.push_back(*d);
  }
  return drives;
}

auto list_fixed_drives(exec::ICommandRunner& runner) -> std::vector<std::string> {
  auto cmd = exec::fixed_drives_query();
  auto r = runner.run(cmd);
  if (!r.launched) throw exec::ToolError("cannot enumerate fixed drives: " + r.error);
  if (r.exit_code != 0) {
    throw exec::ToolError("fixed drive enumeration failed (exit " + std::to_string(r.exit_code) + "): " +
                          std::string(util::trim(r.output)));
  }
  return parse_drive_list(r.output);
}

} // namespace chkdefer::app
