#include "minitest.hpp"
#include "fakes/FakeRunner.hpp"
#include "app/DiskCheck.hpp"
#include "app/Summary.hpp"

#include <sstream>
#include <stdexcept>

namespace ex = chkdefer::exec;
namespace model = chkdefer::model;
using chkdefer::app::DiskCheck;
using chkdefer::app::Settings;

namespace {

struct Machine {
  fakes::FakeRunner runner;
  fakes::RecordingNotifier notifier;
  std::ostringstream out, err;
  chkdefer::ui::Console console{out, err, false};
  Settings settings;
  bool elevated{true};

  // Boot volume C:, pagefiles on C: and D:, all drives clean unless scripted otherwise.
  Machine(const std::string& fixed = "C:\r\nD:\r\nE:\r\n") {
    runner.reply(ex::fixed_drives_query(), 0, fixed);
    runner.reply(ex::system_drive_query(), 0, "C:\r\n");
    runner.reply(ex::pagefile_query(), 0, "C:\\pagefile.sys\r\nD:\\pagefile.sys\r\n");
    for (const char* d : {"C:", "D:", "E:", "F:"}) runner.reply(ex::dirty_query(d), 0, fakes::dirty_output(d, false));
  }

  int run() {
    DiskCheck check(settings, runner, notifier, console, [this] { return elevated; });
    int rc = check.run();
    results = check.results();
    return rc;
  }

  std::vector<model::DriveResult> results;
};

} // namespace

TEST(not_elevated_exits_one_without_commands) {
  Machine m;
  m.elevated = false;
  ASSERT_EQ(m.run(), 1);
  ASSERT_TRUE(m.runner.calls.empty());
  ASSERT_CONTAINS(m.err.str(), "administrator rights are required");
  ASSERT_EQ(m.notifier.shown, 0);
}

TEST(no_fixed_drives_exits_zero) {
  Machine m("");
  ASSERT_EQ(m.run(), 0);
  ASSERT_CONTAINS(m.out.str(), "No fixed drives found.");
  ASSERT_TRUE(m.results.empty());
  ASSERT_EQ(m.runner.count_label("read-only check"), 0);
}

TEST(enumeration_failure_is_fatal) {
  Machine m;
  m.runner.unlaunchable(ex::fixed_drives_query());
  ASSERT_EQ(m.run(), 1);
  ASSERT_CONTAINS(m.err.str(), "ERROR: cannot enumerate fixed drives");
}

TEST(all_healthy_no_notification) {
  Machine m;
  ASSERT_EQ(m.run(), 0);
  ASSERT_EQ(m.results.size(), 3u);
  for (const auto& r : m.results) {
    ASSERT_TRUE(r.outcome == model::Outcome::Healthy);
    ASSERT_EQ(r.scan_exit.value(), 0);
  }
  ASSERT_EQ(m.runner.count_label("read-only check"), 3);
  ASSERT_EQ(m.runner.count_label("create idle task"), 0);
  ASSERT_EQ(m.notifier.shown, 0);
}

TEST(dirty_drive_is_skipped_without_scan) {
  Machine m;
  m.runner.reply(ex::dirty_query("D:"), 0, fakes::dirty_output("D:", true));
  ASSERT_EQ(m.run(), 0);
  ASSERT_TRUE(m.results[1].outcome == model::Outcome::AlreadyDirty);
  ASSERT_FALSE(m.results[1].scan_exit.has_value());
  ASSERT_FALSE(m.runner.ran(ex::readonly_scan("D:")));
  ASSERT_FALSE(m.runner.ran(ex::boot_repair("D:")));
  ASSERT_CONTAINS(m.out.str(), "Already pending repair:");
}

TEST(data_drive_with_errors_gets_idle_task) {
  Machine m;
  m.runner.reply(ex::readonly_scan("E:"), 3);
  ASSERT_EQ(m.run(), 0);
  ASSERT_TRUE(m.results[0].classification == model::Classification::RebootRequired);
  ASSERT_TRUE(m.results[1].classification == model::Classification::RebootRequired);
  ASSERT_TRUE(m.results[2].classification == model::Classification::IdleEligible);
  ASSERT_TRUE(m.results[2].outcome == model::Outcome::IdleScheduled);
  ASSERT_EQ(m.results[2].scan_exit.value(), 3);
  auto idle = m.runner.calls.back();
  ASSERT_EQ(idle.label, "create idle task");
  ASSERT_EQ(idle.argv[3], "ChkdskRepair_E");
  ASSERT_EQ(idle.argv[9], "10");
  ASSERT_FALSE(m.runner.ran(ex::boot_repair("E:")));
  // Nothing needs a restart, so no notification
  ASSERT_EQ(m.notifier.shown, 0);
}

TEST(pagefile_drive_with_errors_needs_restart_and_notifies) {
  Machine m;
  m.runner.reply(ex::readonly_scan("D:"), 3);
  m.runner.reply(ex::readonly_scan("E:"), 3);
  ASSERT_EQ(m.run(), 0);
  ASSERT_TRUE(m.results[1].outcome == model::Outcome::RebootScheduled);
  ASSERT_TRUE(m.results[2].outcome == model::Outcome::IdleScheduled);
  ASSERT_TRUE(m.runner.ran(ex::boot_repair("D:")));
  ASSERT_TRUE(m.runner.ran(ex::force_boot_check("D:")));
  ASSERT_TRUE(m.runner.ran(ex::dirty_set("D:")));
  ASSERT_EQ(m.notifier.shown, 1);
  ASSERT_EQ(m.notifier.last_title, "Disk repair scheduled");
  ASSERT_CONTAINS(m.notifier.last_body, "following drives: D:.");
  ASSERT_CONTAINS(m.notifier.last_body, "idle: E:.");
  ASSERT_CONTAINS(m.out.str(), "Restart the computer to repair D:.");
}

TEST(idle_failure_lands_in_reboot_and_failed) {
  Machine m;
  m.runner.reply(ex::readonly_scan("E:"), 3);
  chkdefer::model::TaskDescriptor t;
  t.name = "ChkdskRepair_E";
  t.drive = "E:";
  t.action = ex::idle_task_action("E:", t.name);
  m.runner.reply(ex::create_idle_task(t), 1, "ERROR: Access is denied.");
  ASSERT_EQ(m.run(), 0);
  ASSERT_TRUE(m.results[2].outcome == model::Outcome::RebootScheduled);
  ASSERT_TRUE(m.results[2].idle_fallback);
  ASSERT_EQ(m.notifier.shown, 1);
  ASSERT_CONTAINS(m.notifier.last_body, "following drives: E:.");
  auto out = m.out.str();
  ASSERT_CONTAINS(out, "Repair at next restart:");
  ASSERT_CONTAINS(out, "Scheduling failed:");
}

TEST(scan_per_drive_order_dirty_then_scan) {
  Machine m("E:\r\n");
  m.run();
  int dirty = m.runner.index_of(ex::dirty_query("E:"));
  int scan = m.runner.index_of(ex::readonly_scan("E:"));
  ASSERT_TRUE(dirty >= 0);
  ASSERT_TRUE(scan > dirty);
}

TEST(notification_disabled) {
  Machine m;
  m.settings.notify = false;
  m.runner.reply(ex::readonly_scan("C:"), 3);
  ASSERT_EQ(m.run(), 0);
  ASSERT_EQ(m.notifier.shown, 0);
}

TEST(notifier_failure_is_warning_only) {
  Machine m;
  m.notifier.succeed = false;
  m.runner.reply(ex::readonly_scan("C:"), 3);
  ASSERT_EQ(m.run(), 0);
  ASSERT_EQ(m.notifier.shown, 1);
  ASSERT_CONTAINS(m.err.str(), "could not show the recording notification");
}

TEST(restart_step_failures_do_not_change_outcomes) {
  Machine m;
  m.runner.reply(ex::readonly_scan("C:"), 3);
  m.runner.reply(ex::readonly_scan("E:"), 3);
  m.runner.reply(ex::force_boot_check("C:"), 1);
  m.runner.reply(ex::force_boot_check("E:"), 1);
  chkdefer::model::TaskDescriptor t;
  t.name = "ChkdskRepair_E";
  t.drive = "E:";
  t.action = ex::idle_task_action("E:", t.name);
  m.runner.reply(ex::create_idle_task(t), 1);
  ASSERT_EQ(m.run(), 0);

  ASSERT_TRUE(m.results[0].outcome == model::Outcome::RebootScheduled);
  ASSERT_TRUE(m.runner.ran(ex::dirty_set("C:")));
  ASSERT_TRUE(m.results[2].outcome == model::Outcome::RebootScheduled);
  ASSERT_TRUE(m.results[2].idle_fallback);
  ASSERT_TRUE(m.runner.ran(ex::dirty_set("E:")));

  auto s = chkdefer::app::summarize(m.results);
  ASSERT_TRUE(s.reboot == (std::vector<std::string>{"C:", "E:"}));
  ASSERT_TRUE(s.failed == std::vector<std::string>{"E:"});
  ASSERT_EQ(m.notifier.shown, 1);
  ASSERT_CONTAINS(m.notifier.last_body, "following drives: C:, E:.");
  ASSERT_CONTAINS(m.err.str(), "'force boot check' for C: reported exit 1");
  ASSERT_CONTAINS(m.out.str(), "C: exit 3 -> scheduled-reboot-repair (unconfirmed: force boot check (exit 1))");
}

TEST(missing_chkdsk_is_fatal) {
  Machine m;
  m.runner.unlaunchable(ex::readonly_scan("C:"));
  ASSERT_EQ(m.run(), 1);
  ASSERT_CONTAINS(m.err.str(), "cannot run read-only check on C:");
}
