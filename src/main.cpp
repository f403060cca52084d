#include "app/DiskCheck.hpp"
#include "app/Notifier.hpp"
#include "app/Privilege.hpp"
#include "app/Settings.hpp"
#include "exec/DryRunRunner.hpp"
#include "exec/ProcessRunner.hpp"
#include "ui/Console.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace chkdefer;

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  app::Settings settings;
  std::vector<std::string> warnings;
  try {
    auto cli = app::parse_command_line(args);
    if (cli.help) {
      std::cout << app::usage_text();
      return 0;
    }
    settings = app::resolve_settings(cli, [](const char* name){ return std::getenv(name); }, warnings);
  } catch (const app::UsageError& e) {
    std::fprintf(stderr, "chkdefer: %s\n\n%s", e.what(), app::usage_text());
    return 1;
  }

  ui::Console console(std::cout, std::cerr, ui::want_color(settings.color, stdout));
  for (const auto& w : warnings) console.warn(w);

  exec::ProcessRunner process(settings.verbose);
  exec::DryRunRunner dry(process, console);
  exec::ICommandRunner& runner = settings.dry_run ? static_cast<exec::ICommandRunner&>(dry) : process;
  if (settings.verbose) {
    std::fprintf(stderr, "chkdefer: main: runner=%s idle_minutes=%d task_prefix=%s notify=%d\n",
                 runner.name(), settings.idle_minutes, settings.task_prefix.c_str(), settings.notify ? 1 : 0);
  }

  app::DesktopNotifier notifier;
  app::DiskCheck check(settings, runner, notifier, console, &app::is_elevated);
  int rc = check.run();
  std::cout.flush();
  return rc;
}
