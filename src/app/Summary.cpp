#include "app/Summary.hpp"
#include "util/Text.hpp"

#include <iomanip>
#include <sstream>

namespace chkdefer::app {

RunSummary summarize(const std::vector<model::DriveResult>& results) {
  RunSummary s;
  for (const auto& r : results) {
    switch (r.outcome) {
      case model::Outcome::Healthy:          s.healthy.push_back(r.drive); break;
      case model::Outcome::AlreadyDirty:     s.already_pending.push_back(r.drive); break;
      case model::Outcome::IdleScheduled:    s.idle.push_back(r.drive); break;
      case model::Outcome::RebootScheduled:
        s.reboot.push_back(r.drive);
        if (r.idle_fallback) s.failed.push_back(r.drive);
        break;
    }
  }
  return s;
}

static void category(ui::Console& console, const char* label, const std::vector<std::string>& drives) {
  if (drives.empty()) return;
  std::ostringstream os;
  os << "  " << std::left << std::setw(28) << label << util::join(drives, ", ");
  console.line(os.str());
}

void print_report(const std::vector<model::DriveResult>& results, const RunSummary& summary, ui::Console& console) {
  console.line("");
  console.heading("Summary");
  category(console, "Healthy:", summary.healthy);
  category(console, "Already pending repair:", summary.already_pending);
  category(console, "Repair at next restart:", summary.reboot);
  category(console, "Repair when idle:", summary.idle);
  category(console, "Scheduling failed:", summary.failed);

  bool any_errors = false;
  for (const auto& r : results) {
    if (!r.scan_exit || *r.scan_exit == 0) continue;
    if (!any_errors) { console.line(""); console.line("  Read-only check exit codes:"); any_errors = true; }
    std::ostringstream os;
    os << "    " << r.drive << " exit " << *r.scan_exit << " -> " << model::to_string(r.outcome);
    if (r.idle_fallback) os << " (idle task failed)";
    if (!r.unconfirmed_steps.empty()) os << " (unconfirmed: " << util::join(r.unconfirmed_steps, ", ") << ")";
    console.line(os.str());
  }

  if (!summary.reboot.empty()) {
    console.line("");
    console.info("Restart the computer to repair " + util::join(summary.reboot, ", ") + ".");
  }
}

std::string notification_text(const RunSummary& summary) {
  if (summary.reboot.empty()) return {};
  std::string text = "A restart is required to repair the following drives: " + util::join(summary.reboot, ", ") + ".";
  if (!summary.idle.empty()) {
    text += "\n\nThese drives will be repaired automatically when the computer is idle: " +
            util::join(summary.idle, ", ") + ".";
  }
  return text;
}

} // namespace chkdefer::app
