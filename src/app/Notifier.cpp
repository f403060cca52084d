#include "app/Notifier.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include "util/WinString.hpp"
#else
#include "util/Subprocess.hpp"
#endif

namespace chkdefer::app {

#ifdef _WIN32

bool DesktopNotifier::notify(const std::string& title, const std::string& body) {
  int rc = ::MessageBoxW(nullptr, util::widen(body).c_str(), util::widen(title).c_str(),
                         MB_OK | MB_ICONWARNING | MB_TOPMOST | MB_SETFOREGROUND);
  return rc != 0;
}

#else

bool DesktopNotifier::notify(const std::string& title, const std::string& body) {
  auto r = util::run_process({"notify-send", "--urgency=critical", title, body});
  return r.ok();
}

#endif

} // namespace chkdefer::app
