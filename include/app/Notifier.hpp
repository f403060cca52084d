#pragma once
#include <string>

namespace chkdefer::app {

class INotifier {
public:
  virtual ~INotifier() = default;

  // Return false if the notification could not be shown.
  [[nodiscard]] virtual bool notify(const std::string& title, const std::string& body) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

// Windows: modal MessageBoxW. POSIX: notify-send.
class DesktopNotifier : public INotifier {
public:
  bool notify(const std::string& title, const std::string& body) override;
  const char* name() const override { return "desktop"; }
};

} // namespace chkdefer::app
