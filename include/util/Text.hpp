#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace chkdefer::util {

// Strip ASCII whitespace (including CR) from both ends.
[[nodiscard]] auto trim(std::string_view sv) -> std::string_view;

[[nodiscard]] auto to_lower_copy(std::string s) -> std::string;

// Split tool output into lines; handles both LF and CRLF.
[[nodiscard]] auto split_lines(std::string_view text) -> std::vector<std::string>;

// Split on a single character and trim each piece; empty pieces are dropped.
[[nodiscard]] auto split_list(std::string_view text, char sep) -> std::vector<std::string>;

[[nodiscard]] auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;

[[nodiscard]] bool contains_icase(std::string_view hay, std::string_view needle);

} // namespace chkdefer::util
