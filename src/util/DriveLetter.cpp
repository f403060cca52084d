#include "util/DriveLetter.hpp"
#include "util/Text.hpp"

#include <cctype>

namespace chkdefer::util {

static bool is_ascii_letter(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

static bool is_separator(char c) { return c == '\\' || c == '/'; }

static std::string make_drive(char letter) {
  std::string d;
  d += static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  d += ':';
  return d;
}

auto normalize_drive(std::string_view text) -> std::optional<std::string> {
  auto sv = trim(text);
  if (sv.empty() || !is_ascii_letter(sv[0])) return std::nullopt;
  if (sv.size() == 1) return make_drive(sv[0]);
  if (sv[1] != ':') return std::nullopt;
  if (sv.size() == 2) return make_drive(sv[0]);
  if (sv.size() == 3 && is_separator(sv[2])) return make_drive(sv[0]);
  return std::nullopt;
}

auto drive_of_path(std::string_view path) -> std::optional<std::string> {
  auto sv = trim(path);
  if (sv.size() < 2 || !is_ascii_letter(sv[0]) || sv[1] != ':') return std::nullopt;
  if (sv.size() > 2 && !is_separator(sv[2])) return std::nullopt; // drive-relative path
  return make_drive(sv[0]);
}

auto drive_letter_only(const std::string& drive) -> std::string {
  if (!drive.empty() && drive.back() == ':') return drive.substr(0, drive.size() - 1);
  return drive;
}

} // namespace chkdefer::util
