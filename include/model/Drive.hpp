#pragma once
#include <optional>
#include <string>
#include <vector>

namespace chkdefer::model {

enum class Classification { RebootRequired, IdleEligible };

// Scheduling-failed is a report category derived from DriveResult::idle_fallback.
enum class Outcome { Healthy, AlreadyDirty, RebootScheduled, IdleScheduled };

// One record per fixed drive, appended in enumeration order.
struct DriveResult {
  std::string drive;                      // normalized "X:"
  Classification classification{Classification::IdleEligible};
  Outcome outcome{Outcome::Healthy};
  std::optional<int> scan_exit;           // set only when the read-only check ran
  bool idle_fallback{false};              // idle task creation failed, restart path used
  std::vector<std::string> unconfirmed_steps;  // restart steps that reported a failure, for display
};

// One-shot idle-time repair task, owned by the OS scheduler once created.
struct TaskDescriptor {
  std::string name;
  std::string drive;
  std::string action;                     // command line the task executes
  int idle_minutes{10};
  std::string run_as{"SYSTEM"};
};

inline const char* to_string(Outcome o) {
  switch (o) {
    case Outcome::Healthy:          return "healthy";
    case Outcome::AlreadyDirty:     return "already-dirty";
    case Outcome::RebootScheduled:  return "scheduled-reboot-repair";
    case Outcome::IdleScheduled:    return "scheduled-idle-repair";
  }
  return "unknown";
}

inline const char* to_string(Classification c) {
  return c == Classification::RebootRequired ? "reboot-required" : "idle-eligible";
}

} // namespace chkdefer::model
