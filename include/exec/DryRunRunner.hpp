#pragma once
#include "exec/ICommandRunner.hpp"
#include "ui/Console.hpp"

namespace chkdefer::exec {

// Passes queries through to 'inner' and prints mutations instead of running them.
class DryRunRunner : public ICommandRunner {
public:
  DryRunRunner(ICommandRunner& inner, ui::Console& console) : inner_(inner), console_(console) {}

  util::ProcessResult run(const Command& cmd) override;
  const char* name() const override { return "dry-run"; }

private:
  ICommandRunner& inner_;
  ui::Console& console_;
};

} // namespace chkdefer::exec
