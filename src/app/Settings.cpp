#include "app/Settings.hpp"
#include "util/ConfigReader.hpp"
#include "util/Text.hpp"

#include <cctype>

namespace chkdefer::app {

bool valid_idle_minutes(int minutes) {
  return minutes >= kMinIdleMinutes && minutes <= kMaxIdleMinutes;
}

bool valid_task_prefix(const std::string& prefix) {
  if (prefix.empty() || prefix.size() > 64) return false;
  for (unsigned char c : prefix) {
    if (!std::isalnum(c) && c != '_' && c != '-') return false;
  }
  return true;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
  CommandLine cli;
  auto value_of = [&](size_t& i) -> const std::string& {
    if (i + 1 >= args.size()) throw UsageError("missing value for " + args[i]);
    return args[++i];
  };
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") cli.help = true;
    else if (a == "--dry-run") cli.dry_run = true;
    else if (a == "--no-notify") cli.notify = false;
    else if (a == "--no-color") cli.color = false;
    else if (a == "--verbose" || a == "-v") cli.verbose = true;
    else if (a == "--idle-minutes") {
      const auto& v = value_of(i);
      auto n = util::ConfigReader::parse_int(v);
      if (!n || !valid_idle_minutes(*n)) {
        throw UsageError("--idle-minutes expects " + std::to_string(kMinIdleMinutes) + ".." +
                         std::to_string(kMaxIdleMinutes) + ", got '" + v + "'");
      }
      cli.idle_minutes = *n;
    }
    else if (a == "--task-prefix") {
      const auto& v = value_of(i);
      if (!valid_task_prefix(v)) throw UsageError("invalid task prefix '" + v + "'");
      cli.task_prefix = v;
    }
    else if (a == "--config") cli.config_path = value_of(i);
    else throw UsageError("unknown argument '" + a + "'");
  }
  return cli;
}

void apply_config(Settings& settings, const util::ConfigReader& cfg, std::vector<std::string>& warnings) {
  bool valid = true;
  if (auto n = cfg.get_int("schedule", "idle_minutes", &valid); n && valid_idle_minutes(*n)) {
    settings.idle_minutes = *n;
  } else if (!valid || n) {
    warnings.push_back("config: ignoring invalid schedule.idle_minutes");
  }
  if (auto p = cfg.get_string("schedule", "task_prefix")) {
    if (valid_task_prefix(*p)) settings.task_prefix = *p;
    else warnings.push_back("config: ignoring invalid schedule.task_prefix '" + *p + "'");
  }
  if (auto b = cfg.get_bool("notify", "enabled", &valid)) settings.notify = *b;
  else if (!valid) warnings.push_back("config: ignoring invalid notify.enabled");
  if (auto m = cfg.get_string("dirty", "markers")) {
    auto markers = util::split_list(*m, ',');
    if (!markers.empty()) settings.dirty_markers = markers;
    else warnings.push_back("config: dirty.markers is empty; keeping defaults");
  }
}

void apply_environment(Settings& settings, const EnvLookup& env, std::vector<std::string>& warnings) {
  auto get = [&](const char* name) -> const char* {
    const char* v = env(name);
    return (v && *v) ? v : nullptr;
  };
  if (const char* v = get("CHKDEFER_IDLE_MINUTES")) {
    auto n = util::ConfigReader::parse_int(v);
    if (n && valid_idle_minutes(*n)) settings.idle_minutes = *n;
    else warnings.push_back(std::string("ignoring CHKDEFER_IDLE_MINUTES='") + v + "'");
  }
  if (const char* v = get("CHKDEFER_TASK_PREFIX")) {
    if (valid_task_prefix(v)) settings.task_prefix = v;
    else warnings.push_back(std::string("ignoring CHKDEFER_TASK_PREFIX='") + v + "'");
  }
  auto flag = [&](const char* name, bool& target) {
    const char* v = get(name);
    if (!v) return;
    if (auto b = util::ConfigReader::parse_bool(v)) target = *b;
    else warnings.push_back(std::string("ignoring ") + name + "='" + v + "'");
  };
  flag("CHKDEFER_NOTIFY", settings.notify);
  flag("CHKDEFER_VERBOSE", settings.verbose);
  flag("CHKDEFER_COLOR", settings.color);
}

void apply_command_line(Settings& settings, const CommandLine& cli) {
  if (cli.dry_run) settings.dry_run = *cli.dry_run;
  if (cli.notify) settings.notify = *cli.notify;
  if (cli.color) settings.color = *cli.color;
  if (cli.verbose) settings.verbose = *cli.verbose;
  if (cli.idle_minutes) settings.idle_minutes = *cli.idle_minutes;
  if (cli.task_prefix) settings.task_prefix = *cli.task_prefix;
}

Settings resolve_settings(const CommandLine& cli, const EnvLookup& env, std::vector<std::string>& warnings) {
  Settings s;
  std::string path;
  if (cli.config_path) path = *cli.config_path;
  else if (const char* v = env("CHKDEFER_CONFIG"); v && *v) path = v;
  if (!path.empty()) {
    util::ConfigReader cfg;
    if (!cfg.load(path)) throw UsageError("cannot read config file '" + path + "'");
    apply_config(s, cfg, warnings);
  }
  apply_environment(s, env, warnings);
  apply_command_line(s, cli);
  return s;
}

const char* usage_text() {
  return
    "Usage: chkdefer [options]\n"
    "Checks every fixed drive read-only and schedules repairs for drives with errors.\n"
    "Boot and pagefile drives are repaired at the next restart; other drives by a\n"
    "one-shot scheduled task that runs when the system is idle. Requires Administrator.\n"
    "\n"
    "Options:\n"
    "  --dry-run            run the checks but only print commands that change state\n"
    "  --no-notify          do not show a desktop notification\n"
    "  --no-color           plain output\n"
    "  --idle-minutes N     idle trigger for repair tasks (1..999, default 10)\n"
    "  --task-prefix P      scheduled task name prefix (default ChkdskRepair_)\n"
    "  --config PATH        settings file (also CHKDEFER_CONFIG)\n"
    "  -v, --verbose        log every executed command to stderr\n"
    "  -h, --help           show this help\n";
}

} // namespace chkdefer::app
