#pragma once
#include "exec/ICommandRunner.hpp"
#include "model/Drive.hpp"
#include "ui/Console.hpp"

#include <string>
#include <vector>

namespace chkdefer::app {

// One command of the restart path as it ran. Statuses are reported, never gated.
struct StepStatus {
  std::string label;
  bool launched{false};
  int exit_code{-1};
  std::string error;
  bool expect_zero{true};   // chkdsk /f signals the deferral to restart through a non-zero status

  [[nodiscard]] bool confirmed() const { return launched && (!expect_zero || exit_code == 0); }
};

// "<prefix><letter>", e.g. ChkdskRepair_E
[[nodiscard]] std::string task_name_for(const std::string& prefix, const std::string& drive);

class RepairScheduler {
public:
  RepairScheduler(exec::ICommandRunner& runner, ui::Console& console, int idle_minutes, std::string task_prefix);

  // chkdsk /f (confirmed), chkntfs /c, fsutil dirty set. All three always run, in order.
  [[nodiscard]] std::vector<StepStatus> schedule_restart_repair(const std::string& drive);

  // Success is the scheduler's own exit status.
  [[nodiscard]] bool create_idle_task(const model::TaskDescriptor& task);

  [[nodiscard]] model::TaskDescriptor describe_task(const std::string& drive) const;

  // Decide and perform the repair for a drive whose read-only check found errors.
  // Sets result.outcome and the fallback flag.
  void repair(model::DriveResult& result);

private:
  void restart_path(model::DriveResult& result);

  exec::ICommandRunner& runner_;
  ui::Console& console_;
  int idle_minutes_;
  std::string task_prefix_;
};

} // namespace chkdefer::app
