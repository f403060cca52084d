#pragma once

namespace chkdefer::app {

// Windows: the process token is a member of BUILTIN\Administrators (and elevated).
// POSIX: effective uid 0.
[[nodiscard]] bool is_elevated();

} // namespace chkdefer::app
