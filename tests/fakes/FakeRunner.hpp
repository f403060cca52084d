#pragma once
#include "app/Notifier.hpp"
#include "exec/Commands.hpp"
#include "exec/ICommandRunner.hpp"

#include <map>
#include <string>
#include <vector>

namespace fakes {

// Scripted command runner: replies by exact command line, records every call.
// Unscripted commands succeed with empty output.
class FakeRunner : public chkdefer::exec::ICommandRunner {
public:
  chkdefer::util::ProcessResult run(const chkdefer::exec::Command& cmd) override {
    calls.push_back(cmd);
    auto it = replies_.find(chkdefer::exec::display(cmd));
    if (it != replies_.end()) return it->second;
    chkdefer::util::ProcessResult r;
    r.launched = true;
    r.exit_code = 0;
    return r;
  }
  const char* name() const override { return "fake"; }

  void reply(const chkdefer::exec::Command& cmd, int exit_code, std::string output = {}) {
    chkdefer::util::ProcessResult r;
    r.launched = true;
    r.exit_code = exit_code;
    r.output = std::move(output);
    replies_[chkdefer::exec::display(cmd)] = r;
  }

  void unlaunchable(const chkdefer::exec::Command& cmd) {
    chkdefer::util::ProcessResult r;
    r.error = "not found";
    replies_[chkdefer::exec::display(cmd)] = r;
  }

  [[nodiscard]] bool ran(const chkdefer::exec::Command& cmd) const {
    auto want = chkdefer::exec::display(cmd);
    for (const auto& c : calls) if (chkdefer::exec::display(c) == want) return true;
    return false;
  }

  [[nodiscard]] int count_label(const std::string& label) const {
    int n = 0;
    for (const auto& c : calls) if (c.label == label) ++n;
    return n;
  }

  // Index of the first call with this command line, or -1.
  [[nodiscard]] int index_of(const chkdefer::exec::Command& cmd) const {
    auto want = chkdefer::exec::display(cmd);
    for (size_t i = 0; i < calls.size(); ++i) if (chkdefer::exec::display(calls[i]) == want) return static_cast<int>(i);
    return -1;
  }

  std::vector<chkdefer::exec::Command> calls;

private:
  std::map<std::string, chkdefer::util::ProcessResult> replies_;
};

class RecordingNotifier : public chkdefer::app::INotifier {
public:
  bool notify(const std::string& title, const std::string& body) override {
    ++shown;
    last_title = title;
    last_body = body;
    return succeed;
  }
  const char* name() const override { return "recording"; }

  bool succeed{true};
  int shown{0};
  std::string last_title;
  std::string last_body;
};

inline std::string dirty_output(const std::string& drive, bool dirty) {
  return "Volume - " + drive + (dirty ? " is Dirty\r\n" : " is NOT Dirty\r\n");
}

} // namespace fakes
