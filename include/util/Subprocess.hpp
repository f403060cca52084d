// Blocking child-process execution with explicit argument vectors
#pragma once
#include <string>
#include <vector>

namespace chkdefer::util {

struct ProcessResult {
  bool launched{false};   // false when the program could not be started at all
  int exit_code{-1};
  std::string output;     // stdout and stderr, merged
  std::string error;      // launch failure description

  [[nodiscard]] bool ok() const { return launched && exit_code == 0; }
};

// Run argv[0] (searched on PATH) with the remaining arguments, write stdin_data
// to its standard input, and wait for it to exit. stdin_data is expected to be
// small (a confirmation token); it is written before output is drained.
[[nodiscard]] auto run_process(const std::vector<std::string>& argv,
                               const std::string& stdin_data = {}) -> ProcessResult;

// Quote a single argument so CommandLineToArgvW / the MSVC runtime parse it back unchanged.
[[nodiscard]] auto quote_windows_arg(const std::string& arg) -> std::string;

// Join argv into one Windows command line.
[[nodiscard]] auto windows_command_line(const std::vector<std::string>& argv) -> std::string;

} // namespace chkdefer::util
