#pragma once
#include "model/Drive.hpp"
#include "ui/Console.hpp"

#include <string>
#include <vector>

namespace chkdefer::app {

// Drive letters per category, in enumeration order. A drive is in exactly one
// list, except an idle-task failure that fell back to a restart repair, which
// is in both 'reboot' and 'failed'.
struct RunSummary {
  std::vector<std::string> healthy;
  std::vector<std::string> reboot;
  std::vector<std::string> idle;
  std::vector<std::string> failed;
  std::vector<std::string> already_pending;
};

[[nodiscard]] RunSummary summarize(const std::vector<model::DriveResult>& results);

void print_report(const std::vector<model::DriveResult>& results, const RunSummary& summary, ui::Console& console);

inline constexpr const char* kNotificationTitle = "Disk repair scheduled";

// Body of the restart notification; empty when no restart is needed.
[[nodiscard]] std::string notification_text(const RunSummary& summary);

} // namespace chkdefer::app
