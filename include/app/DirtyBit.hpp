#pragma once
#include "exec/ICommandRunner.hpp"
#include "ui/Console.hpp"

#include <string>
#include <utility>
#include <vector>

namespace chkdefer::app {

// True when any marker occurs in the dirty query output (case-insensitive).
[[nodiscard]] bool has_dirty_marker(const std::string& output, const std::vector<std::string>& markers);

class DirtyBitInspector {
public:
  DirtyBitInspector(exec::ICommandRunner& runner, ui::Console& console, std::vector<std::string> markers)
      : runner_(runner), console_(console), markers_(std::move(markers)) {}

  // A dirty drive already has a repair pending and must not be scanned or scheduled again.
  [[nodiscard]] bool is_dirty(const std::string& drive);

private:
  exec::ICommandRunner& runner_;
  ui::Console& console_;
  std::vector<std::string> markers_;
};

} // namespace chkdefer::app
