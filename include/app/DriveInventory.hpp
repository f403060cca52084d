#pragma once
#include "exec/ICommandRunner.hpp"

#include <string>
#include <vector>

namespace chkdefer::app {

// Fixed local drives in enumeration order, normalized and deduplicated.
// Throws exec::ToolError when the query cannot run or fails.
[[nodiscard]] auto list_fixed_drives(exec::ICommandRunner& runner) -> std::vector<std::string>;

// Parse one device id per line; unusable lines are skipped.
[[nodiscard]] auto parse_drive_list(const std::string& output) -> std::vector<std::string>;

} // namespace chkdefer::app
