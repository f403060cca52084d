#pragma once
#include "app/Notifier.hpp"
#include "app/Settings.hpp"
#include "exec/ICommandRunner.hpp"
#include "model/Drive.hpp"
#include "ui/Console.hpp"

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace chkdefer::app {

using PrivilegeCheck = std::function<bool()>;

// One pass over all fixed drives: privilege guard, inventory, classification,
// per-drive dirty check / scan / repair, then the summary and notification.
class DiskCheck {
public:
  DiskCheck(Settings settings, exec::ICommandRunner& runner, INotifier& notifier, ui::Console& console,
            PrivilegeCheck elevated);

  // Process exit status: 0 on completion (also when nothing is found), 1 when not
  // elevated or when a fatal error stops the run.
  [[nodiscard]] int run();

  // Per-drive records of the last run, in enumeration order.
  [[nodiscard]] const std::vector<model::DriveResult>& results() const { return results_; }

private:
  [[nodiscard]] int execute();
  [[nodiscard]] model::DriveResult check_drive(const std::string& drive, const std::set<std::string>& reboot_drives);
  void notify_restart(const std::string& body);

  Settings settings_;
  exec::ICommandRunner& runner_;
  INotifier& notifier_;
  ui::Console& console_;
  PrivilegeCheck elevated_;
  std::vector<model::DriveResult> results_;
};

} // namespace chkdefer::app
