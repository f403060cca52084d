#pragma once
#include "util/Subprocess.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace chkdefer::exec {

// Queries only read OS state; mutations change it (dirty bits, boot checks, tasks).
enum class CommandKind { Query, Mutation };

struct Command {
  std::string label;                 // short name for diagnostics, e.g. "dirty query"
  std::vector<std::string> argv;
  std::string stdin_data;
  CommandKind kind{CommandKind::Query};
};

// Swappable seam between the decision logic and the external utilities.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  [[nodiscard]] virtual util::ProcessResult run(const Command& cmd) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

// A utility the run cannot do without failed to start, or an essential query failed.
struct ToolError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Printable command line (Windows quoting, which is what the host tools parse).
[[nodiscard]] std::string display(const Command& cmd);

} // namespace chkdefer::exec
