#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chkdefer::util { class ConfigReader; }

namespace chkdefer::app {

inline constexpr int kDefaultIdleMinutes = 10;
inline constexpr int kMinIdleMinutes = 1;
inline constexpr int kMaxIdleMinutes = 999;   // schtasks /SC ONIDLE /I range
inline constexpr const char* kDefaultTaskPrefix = "ChkdskRepair_";

struct Settings {
  int idle_minutes{kDefaultIdleMinutes};
  std::string task_prefix{kDefaultTaskPrefix};
  bool notify{true};
  bool dry_run{false};
  bool verbose{false};
  bool color{true};
  std::vector<std::string> dirty_markers{"is dirty"};
};

// Flags given on the command line; unset members leave lower layers in effect.
struct CommandLine {
  bool help{false};
  std::optional<bool> dry_run;
  std::optional<bool> notify;
  std::optional<bool> color;
  std::optional<bool> verbose;
  std::optional<int> idle_minutes;
  std::optional<std::string> task_prefix;
  std::optional<std::string> config_path;
};

struct UsageError : public std::runtime_error { using std::runtime_error::runtime_error; };

using EnvLookup = std::function<const char*(const char*)>;

[[nodiscard]] bool valid_idle_minutes(int minutes);
[[nodiscard]] bool valid_task_prefix(const std::string& prefix);

// Throws UsageError on unknown flags and missing or invalid values.
[[nodiscard]] CommandLine parse_command_line(const std::vector<std::string>& args);

// Layer a config file onto 'settings'. Invalid values are skipped with a message in 'warnings'.
void apply_config(Settings& settings, const util::ConfigReader& cfg, std::vector<std::string>& warnings);

// Layer CHKDEFER_* environment variables onto 'settings'.
void apply_environment(Settings& settings, const EnvLookup& env, std::vector<std::string>& warnings);

void apply_command_line(Settings& settings, const CommandLine& cli);

// defaults < config file (--config or CHKDEFER_CONFIG) < environment < flags.
// Throws UsageError when the named config file cannot be read.
[[nodiscard]] Settings resolve_settings(const CommandLine& cli, const EnvLookup& env, std::vector<std::string>& warnings);

[[nodiscard]] const char* usage_text();

} // namespace chkdefer::app
