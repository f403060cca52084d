#include "exec/Commands.hpp"

namespace chkdefer::exec {

static Command powershell(const char* label, const std::string& script) {
  return Command{label, {"powershell.exe", "-NoProfile", "-NonInteractive", "-Command", script}, {}, CommandKind::Query};
}

std::string display(const Command& cmd) {
  return util::windows_command_line(cmd.argv);
}

Command fixed_drives_query() {
  return powershell("fixed drives",
      "Get-CimInstance -ClassName Win32_LogicalDisk -Filter 'DriveType=3' | ForEach-Object { $_.DeviceID }");
}

Command system_drive_query() {
  return powershell("system drive", "(Get-CimInstance -ClassName Win32_OperatingSystem).SystemDrive");
}

Command pagefile_query() {
  return powershell("pagefiles", "Get-CimInstance -ClassName Win32_PageFileUsage | ForEach-Object { $_.Name }");
}

Command dirty_query(const std::string& drive) {
  return Command{"dirty query", {"fsutil", "dirty", "query", drive}, {}, CommandKind::Query};
}

Command readonly_scan(const std::string& drive) {
  return Command{"read-only check", {"chkdsk", drive}, {}, CommandKind::Query};
}

Command boot_repair(const std::string& drive) {
  return Command{"schedule boot repair", {"chkdsk", drive, "/f"}, "Y\r\n", CommandKind::Mutation};
}

Command force_boot_check(const std::string& drive) {
  return Command{"force boot check", {"chkntfs", "/c", drive}, {}, CommandKind::Mutation};
}

Command dirty_set(const std::string& drive) {
  return Command{"set dirty bit", {"fsutil", "dirty", "set", drive}, {}, CommandKind::Mutation};
}

std::string idle_task_action(const std::string& drive, const std::string& task_name) {
  return "cmd.exe /c chkdsk " + drive + " /f /x & schtasks /Delete /TN " + task_name + " /F";
}

Command create_idle_task(const model::TaskDescriptor& task) {
  return Command{"create idle task",
                 {"schtasks", "/Create",
                  "/TN", task.name,
                  "/TR", task.action,
                  "/SC", "ONIDLE",
                  "/I", std::to_string(task.idle_minutes),
                  "/RU", task.run_as,
                  "/RL", "HIGHEST",
                  "/F"},
                 {}, CommandKind::Mutation};
}

} // namespace chkdefer::exec
