#pragma once
#include "exec/ICommandRunner.hpp"
#include "ui/Console.hpp"

#include <set>
#include <string>
#include <vector>

namespace chkdefer::app {

// Drives hosting the boot volume or a pagefile; they can only be repaired at restart.
class RebootClassifier {
public:
  RebootClassifier(exec::ICommandRunner& runner, ui::Console& console) : runner_(runner), console_(console) {}

  // Never throws for lookup failures: warns and continues with what is known.
  [[nodiscard]] std::set<std::string> classify();

private:
  [[nodiscard]] std::string boot_drive();
  [[nodiscard]] std::vector<std::string> pagefile_paths();

  exec::ICommandRunner& runner_;
  ui::Console& console_;
};

inline constexpr const char* kDefaultBootDrive = "C:";

// Union of the boot drive and each pagefile's drive; case-insensitive, deduplicated.
[[nodiscard]] auto build_reboot_set(const std::string& boot_drive,
                                    const std::vector<std::string>& pagefile_paths) -> std::set<std::string>;

} // namespace chkdefer::app
