#include "app/Privilege.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace chkdefer::app {

bool is_elevated() {
#ifdef _WIN32
  BOOL member = FALSE;
  PSID admins = nullptr;
  SID_IDENTIFIER_AUTHORITY nt_authority = SECURITY_NT_AUTHORITY;
  if (!::AllocateAndInitializeSid(&nt_authority, 2, SECURITY_BUILTIN_DOMAIN_RID, DOMAIN_ALIAS_RID_ADMINS,
                                  0, 0, 0, 0, 0, 0, &admins)) {
    return false;
  }
  // With UAC the group is deny-only in a filtered token, so this also requires elevation
  if (!::CheckTokenMembership(nullptr, admins, &member)) member = FALSE;
  ::FreeSid(admins);
  return member == TRUE;
#else
  return ::geteuid() == 0;
#endif
}

} // namespace chkdefer::app
