#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace chkdefer::util {

// Normalize a drive designator ("c", "c:", "C:\") to "C:".
// Returns std::nullopt for anything that is not a single-letter drive.
[[nodiscard]] auto normalize_drive(std::string_view text) -> std::optional<std::string>;

// Extract the drive of an absolute path such as "D:\pagefile.sys".
[[nodiscard]] auto drive_of_path(std::string_view path) -> std::optional<std::string>;

// "E:" -> "E"
[[nodiscard]] auto drive_letter_only(const std::string& drive) -> std::string;

} // namespace chkdefer::util
