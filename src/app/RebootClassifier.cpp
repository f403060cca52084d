#include "app/RebootClassifier.hpp"
#include "exec/Commands.hpp"
#include "util/DriveLetter.hpp"
#include "util/Text.hpp"

namespace chkdefer::app {

auto build_reboot_set(const std::string& boot_drive,
                      const std::vector<std::string>& pagefile_paths) -> std::set<std::string> {
  std::set<std::string> out;
  if (auto d = util::normalize_drive(boot_drive)) out.insert(*d);
  for (const auto& p : pagefile_paths) {
    if (auto d = util::drive_of_path(p)) out.insert(*d);
  }
  return out;
}

std::string RebootClassifier::boot_drive() {
  auto r = runner_.run(exec::system_drive_query());
  if (r.ok()) {
    for (const auto& line : util::split_lines(r.output)) {
      if (auto d = util::normalize_drive(line)) return *d;
    }
  }
  console_.warn(std::string("could not determine the system drive; assuming ") + kDefaultBootDrive);
  return kDefaultBootDrive;
}

std::vector<std::string> RebootClassifier::pagefile_paths() {
  auto r = runner_.run(exec::pagefile_query());
  if (!r.launched) {
    console_.warn("pagefile lookup unavailable (" + r.error + "); only the system drive needs a restart");
    return {};
  }
  if (r.exit_code != 0) {
    console_.warn("pagefile lookup failed (exit " + std::to_string(r.exit_code) +
                  "); only the system drive needs a restart");
    return {};
  }
  std::vector<std::string> paths;
  for (const auto& line : util::split_lines(r.output)) {
    auto t = util::trim(line);
    if (!t.empty()) paths.emplace_back(t);
  }
  return paths;
}

std::set<std::string> RebootClassifier::classify() {
  auto boot = boot_drive();
  return build_reboot_set(boot, pagefile_paths());
}

} // namespace chkdefer::app
