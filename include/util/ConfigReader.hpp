#pragma once

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace chkdefer::util {

// Read-only reader for the small INI/TOML subset used by chkdefer.conf:
// [section] headers, key = value pairs, '#' comments, double-quoted strings.
// Keys before the first header belong to the unnamed section "".
class ConfigReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  void parse(std::string_view text) {
    entries_.clear();
    std::string section;
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t eol = text.find('\n', pos);
      if (eol == std::string_view::npos) eol = text.size();
      auto line = strip(text.substr(pos, eol - pos));
      pos = eol + 1;
      if (line.empty() || line.front() == '#') continue;
      if (line.front() == '[') {
        if (line.back() == ']') section = std::string(strip(line.substr(1, line.size() - 2)));
        continue;
      }
      auto eq = line.find('=');
      if (eq == std::string_view::npos) continue;
      auto key = strip(line.substr(0, eq));
      auto val = strip(line.substr(eq + 1));
      if (key.empty()) continue;
      entries_.push_back({section, std::string(key), unquote(val)});
    }
  }

  [[nodiscard]] std::optional<std::string> get_string(std::string_view section, std::string_view key) const {
    // Last assignment wins
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
      if (it->section == section && it->key == key) return it->value;
    }
    return std::nullopt;
  }

  // std::nullopt when the key is absent; 'valid' reports whether a present value parsed.
  [[nodiscard]] std::optional<int> get_int(std::string_view section, std::string_view key, bool* valid = nullptr) const {
    if (valid) *valid = true;
    auto v = get_string(section, key);
    if (!v) return std::nullopt;
    auto parsed = parse_int(*v);
    if (!parsed && valid) *valid = false;
    return parsed;
  }

  [[nodiscard]] std::optional<bool> get_bool(std::string_view section, std::string_view key, bool* valid = nullptr) const {
    if (valid) *valid = true;
    auto v = get_string(section, key);
    if (!v) return std::nullopt;
    auto parsed = parse_bool(*v);
    if (!parsed && valid) *valid = false;
    return parsed;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return get_string(section, key).has_value();
  }

  [[nodiscard]] bool empty() const { return entries_.empty(); }

  static std::optional<int> parse_int(std::string_view s) {
    s = strip(s);
    if (s.empty()) return std::nullopt;
    bool neg = false;
    size_t i = 0;
    if (s[0] == '-' || s[0] == '+') { neg = s[0] == '-'; i = 1; }
    if (i == s.size()) return std::nullopt;
    long long v = 0;
    for (; i < s.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
      v = v * 10 + (s[i] - '0');
      if (v > 1000000000LL) return std::nullopt;
    }
    return static_cast<int>(neg ? -v : v);
  }

  static std::optional<bool> parse_bool(std::string_view s) {
    s = strip(s);
    std::string lower;
    for (char c : s) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
  }

private:
  struct Entry { std::string section, key, value; };
  std::vector<Entry> entries_;

  static std::string_view strip(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static std::string unquote(std::string_view v) {
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') return std::string(v.substr(1, v.size() - 2));
    // Trailing comment on an unquoted value
    auto hash = v.find(" #");
    if (hash != std::string_view::npos) v = strip(v.substr(0, hash));
    return std::string(v);
  }
};

} // namespace chkdefer::util
