// UTF-8 to UTF-16 conversion for the wide Win32 APIs
#pragma once
#ifdef _WIN32
#include <string>

namespace chkdefer::util {

[[nodiscard]] auto widen(const std::string& s) -> std::wstring;

} // namespace chkdefer::util
#endif
