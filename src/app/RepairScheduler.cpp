#include "app/RepairScheduler.hpp"
#include "exec/Commands.hpp"
#include "util/DriveLetter.hpp"
#include "util/Text.hpp"

#include <utility>

namespace chkdefer::app {

std::string task_name_for(const std::string& prefix, const std::string& drive) {
  return prefix + util::drive_letter_only(drive);
}

RepairScheduler::RepairScheduler(exec::ICommandRunner& runner, ui::Console& console, int idle_minutes,
                                 std::string task_prefix)
    : runner_(runner), console_(console), idle_minutes_(idle_minutes), task_prefix_(std::move(task_prefix)) {}

std::vector<StepStatus> RepairScheduler::schedule_restart_repair(const std::string& drive) {
  std::vector<StepStatus> steps;
  for (const auto& cmd : {exec::boot_repair(drive), exec::force_boot_check(drive), exec::dirty_set(drive)}) {
    auto r = runner_.run(cmd);
    StepStatus st;
    st.label = cmd.label;
    st.launched = r.launched;
    st.exit_code = r.exit_code;
    st.error = r.error;
    steps.push_back(std::move(st));
  }
  steps.front().expect_zero = false;
  return steps;
}

model::TaskDescriptor RepairScheduler::describe_task(const std::string& drive) const {
  model::TaskDescriptor t;
  t.name = task_name_for(task_prefix_, drive);
  t.drive = drive;
  t.action = exec::idle_task_action(drive, t.name);
  t.idle_minutes = idle_minutes_;
  return t;
}

bool RepairScheduler::create_idle_task(const model::TaskDescriptor& task) {
  auto r = runner_.run(exec::create_idle_task(task));
  if (r.ok()) return true;
  std::string why = r.launched ? "exit " + std::to_string(r.exit_code) : r.error;
  auto detail = util::trim(r.output);
  if (!detail.empty()) why += ": " + std::string(detail);
  console_.warn("could not create scheduled task " + task.name + " (" + why + ")");
  return false;
}

void RepairScheduler::restart_path(model::DriveResult& result) {
  for (const auto& st : schedule_restart_repair(result.drive)) {
    if (st.confirmed()) continue;
    std::string status = st.launched ? "exit " + std::to_string(st.exit_code) : "not started: " + st.error;
    result.unconfirmed_steps.push_back(st.label + " (" + status + ")");
    console_.warn("'" + st.label + "' for " + result.drive + " reported " + status +
                  "; the repair at restart may not happen");
  }
  result.outcome = model::Outcome::RebootScheduled;
}

void RepairScheduler::repair(model::DriveResult& result) {
  if (result.classification == model::Classification::RebootRequired) {
    restart_path(result);
    console_.ok(result.drive + " will be repaired at the next restart");
    return;
  }

  auto task = describe_task(result.drive);
  if (create_idle_task(task)) {
    result.outcome = model::Outcome::IdleScheduled;
    console_.ok(result.drive + " will be repaired when the system has been idle for " +
                std::to_string(task.idle_minutes) + " minutes (task " + task.name + ")");
    return;
  }

  console_.warn("falling back to repair at the next restart for " + result.drive);
  result.idle_fallback = true;
  restart_path(result);
  console_.ok(result.drive + " will be repaired at the next restart");
}

} // namespace chkdefer::app
