// Argument vectors of every external utility chkdefer invokes
#pragma once
#include "exec/ICommandRunner.hpp"
#include "model/Drive.hpp"

#include <string>

namespace chkdefer::exec {

// CIM queries through PowerShell; each prints one value per line.
[[nodiscard]] Command fixed_drives_query();
[[nodiscard]] Command system_drive_query();
[[nodiscard]] Command pagefile_query();

// fsutil dirty query X:
[[nodiscard]] Command dirty_query(const std::string& drive);

// chkdsk X: (no switches, read-only)
[[nodiscard]] Command readonly_scan(const std::string& drive);

// chkdsk X: /f, answering the "check at next restart?" prompt with Y
[[nodiscard]] Command boot_repair(const std::string& drive);

// chkntfs /c X:
[[nodiscard]] Command force_boot_check(const std::string& drive);

// fsutil dirty set X:
[[nodiscard]] Command dirty_set(const std::string& drive);

// Command line the idle task runs: repair, then delete the task by name.
[[nodiscard]] std::string idle_task_action(const std::string& drive, const std::string& task_name);

// schtasks /Create ... /SC ONIDLE /I <minutes> /RU SYSTEM /RL HIGHEST /F
[[nodiscard]] Command create_idle_task(const model::TaskDescriptor& task);

} // namespace chkdefer::exec
