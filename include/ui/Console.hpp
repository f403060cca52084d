#pragma once

#include <cstdio>
#include <ostream>
#include <string>

namespace chkdefer::ui {

// User-facing output. Progress and the report go to 'out', warnings and
// errors to 'err'. SGR colors are applied only when enabled.
class Console {
public:
  Console(std::ostream& out, std::ostream& err, bool color);

  void heading(const std::string& text);
  void line(const std::string& text);
  void info(const std::string& text);
  void ok(const std::string& text);
  void warn(const std::string& text);
  void error(const std::string& text);

  [[nodiscard]] bool color() const { return color_; }

private:
  [[nodiscard]] std::string paint(const char* code, const std::string& text) const;

  std::ostream& out_;
  std::ostream& err_;
  bool color_;
};

// True when the stream is attached to a terminal.
[[nodiscard]] bool is_tty(std::FILE* stream);

// Color is used when requested, the stream is a TTY and NO_COLOR is unset.
[[nodiscard]] bool want_color(bool requested, std::FILE* stream);

} // namespace chkdefer::ui
