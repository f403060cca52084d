#include "app/DiskCheck.hpp"
#include "app/DirtyBit.hpp"
#include "app/DriveInventory.hpp"
#include "app/RebootClassifier.hpp"
#include "app/RepairScheduler.hpp"
#include "app/ScanRunner.hpp"
#include "app/Summary.hpp"
#include "util/Text.hpp"

#include <exception>
#include <utility>

namespace chkdefer::app {

DiskCheck::DiskCheck(Settings settings, exec::ICommandRunner& runner, INotifier& notifier, ui::Console& console,
                     PrivilegeCheck elevated)
    : settings_(std::move(settings)), runner_(runner), notifier_(notifier), console_(console),
      elevated_(std::move(elevated)) {}

int DiskCheck::run() {
  try {
    return execute();
  } catch (const std::exception& e) {
    console_.error(e.what());
    return 1;
  }
}

int DiskCheck::execute() {
  results_.clear();
  if (!elevated_()) {
    console_.error("administrator rights are required; run chkdefer from an elevated prompt");
    return 1;
  }

  auto drives = list_fixed_drives(runner_);
  if (drives.empty()) {
    console_.line("No fixed drives found.");
    return 0;
  }

  RebootClassifier classifier(runner_, console_);
  auto reboot_drives = classifier.classify();
  console_.info("Fixed drives: " + util::join(drives, ", "));
  console_.info("Repair at restart only: " +
                util::join(std::vector<std::string>(reboot_drives.begin(), reboot_drives.end()), ", "));

  for (const auto& d : drives) results_.push_back(check_drive(d, reboot_drives));

  auto summary = summarize(results_);
  print_report(results_, summary, console_);
  if (!summary.reboot.empty()) notify_restart(notification_text(summary));
  return 0;
}

model::DriveResult DiskCheck::check_drive(const std::string& drive, const std::set<std::string>& reboot_drives) {
  model::DriveResult r;
  r.drive = drive;
  r.classification = reboot_drives.count(drive) ? model::Classification::RebootRequired
                                                : model::Classification::IdleEligible;
  console_.line("");
  console_.heading("Checking " + drive + " (" + model::to_string(r.classification) + ")");

  DirtyBitInspector dirty(runner_, console_, settings_.dirty_markers);
  if (dirty.is_dirty(drive)) {
    r.outcome = model::Outcome::AlreadyDirty;
    console_.line(drive + " is already marked for repair; skipping");
    return r;
  }

  ScanRunner scanner(runner_);
  int code = scanner.scan(drive);
  r.scan_exit = code;
  if (code == 0) {
    r.outcome = model::Outcome::Healthy;
    console_.ok(drive + " has no errors");
    return r;
  }
  console_.warn("read-only check found errors on " + drive + " (exit " + std::to_string(code) + ")");

  RepairScheduler scheduler(runner_, console_, settings_.idle_minutes, settings_.task_prefix);
  scheduler.repair(r);
  return r;
}

void DiskCheck::notify_restart(const std::string& body) {
  if (!settings_.notify) return;
  if (settings_.dry_run) {
    console_.line("[dry-run] notification: " + body);
    return;
  }
  try {
    if (!notifier_.notify(kNotificationTitle, body)) {
      console_.warn(std::string("could not show the ") + notifier_.name() + " notification");
    }
  } catch (const std::exception& e) {
    console_.warn(std::string("notification failed: ") + e.what());
  }
}

} // namespace chkdefer::app
