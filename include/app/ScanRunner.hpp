#pragma once
#include "exec/ICommandRunner.hpp"

#include <string>

namespace chkdefer::app {

class ScanRunner {
public:
  explicit ScanRunner(exec::ICommandRunner& runner) : runner_(runner) {}

  // Exit status of the read-only check: 0 = clean, anything else = errors found.
  // The value is kept for display only. Throws exec::ToolError if chkdsk cannot start.
  [[nodiscard]] int scan(const std::string& drive);

private:
  exec::ICommandRunner& runner_;
};

} // namespace chkdefer::app
