#include "ui/Console.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace chkdefer::ui {

Console::Console(std::ostream& out, std::ostream& err, bool color)
    : out_(out), err_(err), color_(color) {}

std::string Console::paint(const char* code, const std::string& text) const {
  if (!color_) return text;
  return std::string("\x1B[") + code + "m" + text + "\x1B[0m";
}

void Console::heading(const std::string& text) { out_ << paint("1", text) << "\n"; }

void Console::line(const std::string& text) { out_ << text << "\n"; }

void Console::info(const std::string& text) { out_ << paint("96", text) << "\n"; }

void Console::ok(const std::string& text) { out_ << paint("32", text) << "\n"; }

void Console::warn(const std::string& text) {
  out_.flush();
  err_ << paint("33", "WARNING: " + text) << "\n";
}

void Console::error(const std::string& text) {
  out_.flush();
  err_ << paint("31", "ERROR: " + text) << "\n";
}

bool is_tty(std::FILE* stream) {
#ifdef _WIN32
  return ::_isatty(::_fileno(stream)) != 0;
#else
  return ::isatty(::fileno(stream)) == 1;
#endif
}

bool want_color(bool requested, std::FILE* stream) {
  if (!requested) return false;
  const char* nc = std::getenv("NO_COLOR");
  if (nc && *nc) return false;
  return is_tty(stream);
}

} // namespace chkdefer::ui
