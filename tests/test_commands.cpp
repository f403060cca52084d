#include "minitest.hpp"
#include "app/RepairScheduler.hpp"
#include "exec/Commands.hpp"

#include <sstream>

namespace ex = chkdefer::exec;

static std::string line_of(const ex::Command& c) { return ex::display(c); }

TEST(commands_dirty_and_scan_are_queries) {
  ASSERT_EQ(line_of(ex::dirty_query("C:")), "fsutil dirty query C:");
  ASSERT_EQ(line_of(ex::readonly_scan("E:")), "chkdsk E:");
  ASSERT_TRUE(ex::dirty_query("C:").kind == ex::CommandKind::Query);
  ASSERT_TRUE(ex::readonly_scan("C:").kind == ex::CommandKind::Query);
}

TEST(commands_restart_chain_are_mutations) {
  auto repair = ex::boot_repair("D:");
  ASSERT_EQ(line_of(repair), "chkdsk D: /f");
  ASSERT_EQ(repair.stdin_data, "Y\r\n");
  ASSERT_EQ(line_of(ex::force_boot_check("D:")), "chkntfs /c D:");
  ASSERT_EQ(line_of(ex::dirty_set("D:")), "fsutil dirty set D:");
  ASSERT_TRUE(repair.kind == ex::CommandKind::Mutation);
  ASSERT_TRUE(ex::force_boot_check("D:").kind == ex::CommandKind::Mutation);
  ASSERT_TRUE(ex::dirty_set("D:").kind == ex::CommandKind::Mutation);
}

TEST(commands_cim_queries_use_powershell) {
  auto fixed = ex::fixed_drives_query();
  ASSERT_EQ(fixed.argv.front(), "powershell.exe");
  ASSERT_CONTAINS(fixed.argv.back(), "Win32_LogicalDisk");
  ASSERT_CONTAINS(fixed.argv.back(), "DriveType=3");
  ASSERT_CONTAINS(ex::pagefile_query().argv.back(), "Win32_PageFileUsage");
  ASSERT_CONTAINS(ex::system_drive_query().argv.back(), "SystemDrive");
}

TEST(idle_task_descriptor_and_command) {
  std::ostringstream out, err;
  chkdefer::ui::Console console(out, err, false);
  struct NullRunner : ex::ICommandRunner {
    chkdefer::util::ProcessResult run(const ex::Command&) override { return {}; }
    const char* name() const override { return "null"; }
  } runner;
  chkdefer::app::RepairScheduler sched(runner, console, 10, "ChkdskRepair_");
  auto task = sched.describe_task("E:");
  ASSERT_EQ(task.name, "ChkdskRepair_E");
  ASSERT_EQ(task.idle_minutes, 10);
  ASSERT_EQ(task.run_as, "SYSTEM");
  ASSERT_EQ(task.action, "cmd.exe /c chkdsk E: /f /x & schtasks /Delete /TN ChkdskRepair_E /F");

  auto cmd = ex::create_idle_task(task);
  std::vector<std::string> want = {"schtasks", "/Create", "/TN", "ChkdskRepair_E",
                                   "/TR", task.action, "/SC", "ONIDLE", "/I", "10",
                                   "/RU", "SYSTEM", "/RL", "HIGHEST", "/F"};
  ASSERT_TRUE(cmd.argv == want);
  ASSERT_CONTAINS(line_of(cmd), "/TR \"cmd.exe /c chkdsk E: /f /x & schtasks /Delete /TN ChkdskRepair_E /F\"");
}

TEST(task_name_is_deterministic) {
  ASSERT_EQ(chkdefer::app::task_name_for("ChkdskRepair_", "E:"), "ChkdskRepair_E");
  ASSERT_EQ(chkdefer::app::task_name_for("ChkdskRepair_", "E:"),
            chkdefer::app::task_name_for("ChkdskRepair_", "E:"));
  ASSERT_EQ(chkdefer::app::task_name_for("Fix-", "G:"), "Fix-G");
}
