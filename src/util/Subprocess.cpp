#include "util/Subprocess.hpp"
#include "util/WinString.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <csignal>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace chkdefer::util {

auto quote_windows_arg(const std::string& arg) -> std::string {
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) return arg;
  std::string out = "\"";
  for (size_t i = 0; i < arg.size(); ++i) {
    size_t backslashes = 0;
    while (i < arg.size() && arg[i] == '\\') { ++backslashes; ++i; }
    if (i == arg.size()) {
      // Double trailing backslashes so the closing quote stays a delimiter
      out.append(backslashes * 2, '\\');
      break;
    }
    if (arg[i] == '"') {
      out.append(backslashes * 2 + 1, '\\');
      out += '"';
    } else {
      out.append(backslashes, '\\');
      out += arg[i];
    }
  }
  out += '"';
  return out;
}

auto windows_command_line(const std::vector<std::string>& argv) -> std::string {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i) line += ' ';
    line += quote_windows_arg(argv[i]);
  }
  return line;
}

#ifdef _WIN32

namespace {

class UniqueHandle {
public:
  UniqueHandle() = default;
  explicit UniqueHandle(HANDLE h) : h_(h) {}
  ~UniqueHandle() { reset(); }
  UniqueHandle(const UniqueHandle&) = delete;
  UniqueHandle& operator=(const UniqueHandle&) = delete;

  HANDLE get() const { return h_; }
  HANDLE* out() { reset(); return &h_; }
  void reset() {
    if (h_ && h_ != INVALID_HANDLE_VALUE) ::CloseHandle(h_);
    h_ = nullptr;
  }

private:
  HANDLE h_{nullptr};
};

// Console tools write in the OEM code page when redirected.
std::string oem_to_utf8(const std::string& raw) {
  if (raw.empty()) return {};
  int wn = ::MultiByteToWideChar(CP_OEMCP, 0, raw.data(), static_cast<int>(raw.size()), nullptr, 0);
  if (wn <= 0) return raw;
  std::wstring w(static_cast<size_t>(wn), L'\0');
  ::MultiByteToWideChar(CP_OEMCP, 0, raw.data(), static_cast<int>(raw.size()), w.data(), wn);
  int un = ::WideCharToMultiByte(CP_UTF8, 0, w.data(), wn, nullptr, 0, nullptr, nullptr);
  std::string out(static_cast<size_t>(un), '\0');
  ::WideCharToMultiByte(CP_UTF8, 0, w.data(), wn, out.data(), un, nullptr, nullptr);
  return out;
}

std::string last_error_text(const char* what) {
  return std::string(what) + " failed (error " + std::to_string(::GetLastError()) + ")";
}

} // namespace

auto run_process(const std::vector<std::string>& argv, const std::string& stdin_data) -> ProcessResult {
  ProcessResult r;
  if (argv.empty()) { r.error = "empty command"; return r; }

  SECURITY_ATTRIBUTES sa{};
  sa.nLength = sizeof(sa);
  sa.bInheritHandle = TRUE;

  UniqueHandle out_rd, out_wr, in_rd, in_wr;
  if (!::CreatePipe(out_rd.out(), out_wr.out(), &sa, 0) ||
      !::SetHandleInformation(out_rd.get(), HANDLE_FLAG_INHERIT, 0)) {
    r.error = last_error_text("CreatePipe(stdout)");
    return r;
  }
  if (!::CreatePipe(in_rd.out(), in_wr.out(), &sa, 0) ||
      !::SetHandleInformation(in_wr.get(), HANDLE_FLAG_INHERIT, 0)) {
    r.error = last_error_text("CreatePipe(stdin)");
    return r;
  }

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = in_rd.get();
  si.hStdOutput = out_wr.get();
  si.hStdError = out_wr.get();

  // CreateProcessW requires a mutable buffer
  std::wstring cmdline = widen(windows_command_line(argv));
  std::vector<wchar_t> buf(cmdline.begin(), cmdline.end());
  buf.push_back(0);

  PROCESS_INFORMATION pi{};
  BOOL ok = ::CreateProcessW(nullptr, buf.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                             nullptr, nullptr, &si, &pi);
  if (!ok) {
    r.error = last_error_text("CreateProcessW");
    return r;
  }
  UniqueHandle process(pi.hProcess), thread(pi.hThread);
  r.launched = true;

  // Child owns its copies now; drop ours so EOF propagates
  out_wr.reset();
  in_rd.reset();

  if (!stdin_data.empty()) {
    DWORD written = 0;
    if (!::WriteFile(in_wr.get(), stdin_data.data(), static_cast<DWORD>(stdin_data.size()), &written, nullptr)) {
      std::fprintf(stderr, "chkdefer: Subprocess: %s\n", last_error_text("WriteFile(stdin)").c_str());
    }
  }
  in_wr.reset();

  std::string raw;
  char chunk[4096];
  DWORD got = 0;
  while (::ReadFile(out_rd.get(), chunk, sizeof(chunk), &got, nullptr) && got > 0) {
    raw.append(chunk, got);
  }

  ::WaitForSingleObject(process.get(), INFINITE);
  DWORD code = 0;
  if (::GetExitCodeProcess(process.get(), &code)) {
    r.exit_code = static_cast<int>(code);
  }
  r.output = oem_to_utf8(raw);
  return r;
}

#else // POSIX

static bool make_pipe(int fds[2]) {
  if (::pipe(fds) != 0) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

static void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

auto run_process(const std::vector<std::string>& argv, const std::string& stdin_data) -> ProcessResult {
  // A child that exits before reading stdin must not kill us with SIGPIPE
  static const bool sigpipe_ignored = []{ std::signal(SIGPIPE, SIG_IGN); return true; }();
  (void)sigpipe_ignored;

  ProcessResult r;
  if (argv.empty()) { r.error = "empty command"; return r; }

  int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(exec_pipe)) {
    r.error = std::string("pipe: ") + std::strerror(errno);
    for (int* p : {in_pipe, out_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
    return r;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    r.error = std::string("fork: ") + std::strerror(errno);
    for (int* p : {in_pipe, out_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
    return r;
  }
  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    if (::write(exec_pipe[1], &err, sizeof(err)) < 0) { /* parent sees EOF */ }
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(exec_pipe[1]);

  // exec_pipe closes on successful exec (CLOEXEC); otherwise it carries errno
  int exec_errno = 0;
  ssize_t n;
  do { n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno)); } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    r.error = std::string("exec ") + argv[0] + ": " + std::strerror(exec_errno);
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    return r;
  }
  r.launched = true;

  size_t off = 0;
  while (off < stdin_data.size()) {
    ssize_t w = ::write(in_pipe[1], stdin_data.data() + off, stdin_data.size() - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      break; // EPIPE: child did not want input
    }
    off += static_cast<size_t>(w);
  }
  close_fd(in_pipe[1]);

  char chunk[4096];
  for (;;) {
    ssize_t got = ::read(out_pipe[0], chunk, sizeof(chunk));
    if (got < 0 && errno == EINTR) continue;
    if (got <= 0) break;
    r.output.append(chunk, static_cast<size_t>(got));
  }
  close_fd(out_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { r.error = std::string("waitpid: ") + std::strerror(errno); return r; }
  }
  if (WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) r.exit_code = 128 + WTERMSIG(status);
  return r;
}

#endif

} // namespace chkdefer::util
