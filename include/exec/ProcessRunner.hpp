#pragma once
#include "exec/ICommandRunner.hpp"

namespace chkdefer::exec {

// Runs commands as real child processes.
class ProcessRunner : public ICommandRunner {
public:
  explicit ProcessRunner(bool verbose = false) : verbose_(verbose) {}

  util::ProcessResult run(const Command& cmd) override;
  const char* name() const override { return "process"; }

private:
  bool verbose_;
};

} // namespace chkdefer::exec
