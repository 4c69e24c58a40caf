#include "launch/process_runner.hpp"

#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include <fmt/format.h>

namespace devlaunch::launch {

std::string ProcessResult::describe() const {
  if (error) {
    return error->what;
  }
  if (signal) {
    return fmt::format("killed by signal {}", *signal);
  }
  return fmt::format("exited with code {}", exit_code);
}

#if defined(_WIN32)

namespace {

std::wstring utf8_to_wide(const std::string &input) {
  if (input.empty()) {
    return L"";
  }
  const int size_needed =
      MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
  if (size_needed <= 1) {
    return L"";
  }
  std::wstring result(static_cast<size_t>(size_needed - 1), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, result.data(),
                      size_needed);
  return result;
}

std::string wide_to_utf8(const std::wstring &input) {
  if (input.empty()) {
    return std::string();
  }
  const int size_needed = WideCharToMultiByte(CP_UTF8, 0, input.c_str(), -1,
                                              nullptr, 0, nullptr, nullptr);
  if (size_needed <= 1) {
    return std::string();
  }
  std::string result(static_cast<size_t>(size_needed - 1), '\0');
  WideCharToMultiByte(CP_UTF8, 0, input.c_str(), -1, result.data(),
                      size_needed, nullptr, nullptr);
  return result;
}

std::wstring quote_windows_arg(const std::wstring &arg) {
  if (arg.empty()) {
    return L"\"\"";
  }
  if (arg.find_first_of(L" \t\"") == std::wstring::npos) {
    return arg;
  }

  std::wstring result;
  result.reserve(arg.size() + 2);
  result.push_back(L'"');
  size_t backslashes = 0;
  for (wchar_t ch : arg) {
    if (ch == L'\\') {
      ++backslashes;
    } else if (ch == L'"') {
      result.append(backslashes * 2 + 1, L'\\');
      result.push_back(L'"');
      backslashes = 0;
    } else {
      if (backslashes > 0) {
        result.append(backslashes, L'\\');
        backslashes = 0;
      }
      result.push_back(ch);
    }
  }
  if (backslashes > 0) {
    result.append(backslashes * 2, L'\\');
  }
  result.push_back(L'"');
  return result;
}

std::wstring join_command_line(const std::vector<std::string> &args) {
  std::wstring command_line;
  bool first = true;
  for (const auto &arg : args) {
    if (!first) {
      command_line.push_back(L' ');
    }
    first = false;
    command_line += quote_windows_arg(utf8_to_wide(arg));
  }
  return command_line;
}

std::string format_last_error(DWORD error_code) {
  LPWSTR buffer = nullptr;
  const DWORD chars = FormatMessageW(
      FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
          FORMAT_MESSAGE_IGNORE_INSERTS,
      nullptr, error_code, 0, reinterpret_cast<LPWSTR>(&buffer), 0, nullptr);
  if (chars == 0 || buffer == nullptr) {
    return std::string("Win32 error ") + std::to_string(error_code);
  }
  std::wstring message(buffer, chars);
  LocalFree(buffer);
  while (!message.empty() &&
         (message.back() == L'\r' || message.back() == L'\n')) {
    message.pop_back();
  }
  return wide_to_utf8(message);
}

void drain_pipe(HANDLE read_end, std::string &out) {
  DWORD available = 0;
  while (PeekNamedPipe(read_end, nullptr, 0, nullptr, &available, nullptr) &&
         available > 0) {
    char buf[4096];
    DWORD got = 0;
    DWORD want = available < sizeof(buf) ? available : sizeof(buf);
    if (!ReadFile(read_end, buf, want, &got, nullptr) || got == 0) {
      return;
    }
    out.append(buf, got);
  }
}

} // namespace

ProcessResult SystemProcessRunner::run(const ProcessSpec &spec) {
  ProcessResult result;
  if (spec.argv.empty()) {
    result.error = make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                              "empty command line");
    return result;
  }

  std::wstring command_line = join_command_line(spec.argv);
  std::vector<wchar_t> cmd_buffer(command_line.begin(), command_line.end());
  cmd_buffer.push_back(L'\0');

  std::wstring cwd = spec.working_dir.empty()
                         ? std::wstring()
                         : spec.working_dir.wstring();

  HANDLE read_end = nullptr;
  HANDLE write_end = nullptr;
  STARTUPINFOW si;
  ZeroMemory(&si, sizeof(si));
  si.cb = sizeof(si);
  if (spec.capture_stdout) {
    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
      result.error = make_error(
          my_errors::LAUNCH::SPAWN_FAILED,
          "CreatePipe failed: " + format_last_error(GetLastError()));
      return result;
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = GetStdHandle(STD_ERROR_HANDLE);
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
  }

  PROCESS_INFORMATION pi;
  ZeroMemory(&pi, sizeof(pi));
  BOOL created = CreateProcessW(
      nullptr, cmd_buffer.data(), nullptr, nullptr,
      spec.capture_stdout ? TRUE : FALSE, 0, nullptr,
      cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
  if (write_end) {
    CloseHandle(write_end);
  }
  if (!created) {
    DWORD err = GetLastError();
    if (read_end) {
      CloseHandle(read_end);
    }
    result.error = make_error(my_errors::LAUNCH::SPAWN_FAILED,
                              "CreateProcess failed for '" + spec.argv[0] +
                                  "': " + format_last_error(err));
    return result;
  }

  const auto start = std::chrono::steady_clock::now();
  const DWORD slice_ms = read_end ? 50 : INFINITE;
  bool timed_out = false;
  while (true) {
    DWORD wait_ms = slice_ms;
    if (spec.timeout_ms > 0 && !read_end) {
      wait_ms = spec.timeout_ms;
    }
    DWORD wait_result = WaitForSingleObject(pi.hProcess, wait_ms);
    if (read_end) {
      drain_pipe(read_end, result.output);
    }
    if (wait_result == WAIT_OBJECT_0) {
      break;
    }
    if (wait_result != WAIT_TIMEOUT) {
      DWORD err = GetLastError();
      result.error =
          make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                     "WaitForSingleObject failed: " + format_last_error(err));
      break;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    if (spec.timeout_ms > 0 &&
        elapsed >= std::chrono::milliseconds(spec.timeout_ms)) {
      TerminateProcess(pi.hProcess, 1u);
      WaitForSingleObject(pi.hProcess, INFINITE);
      timed_out = true;
      break;
    }
  }

  if (read_end) {
    drain_pipe(read_end, result.output);
    CloseHandle(read_end);
  }

  if (timed_out) {
    result.error = make_error(my_errors::LAUNCH::CHILD_TIMEOUT,
                              "command timed out");
  } else if (!result.error) {
    DWORD exit_code = 0;
    if (!GetExitCodeProcess(pi.hProcess, &exit_code)) {
      result.error = make_error(
          my_errors::GENERAL::UNEXPECTED_RESULT,
          "GetExitCodeProcess failed: " + format_last_error(GetLastError()));
    } else {
      result.exit_code = static_cast<int>(exit_code);
    }
  }

  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
  return result;
}

#else

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Reads whatever is available on `fd` within `wait_ms`. Closes the fd on
// EOF. Returns false when nothing arrived in time.
bool pump_fd(int &fd, std::string &out, int wait_ms) {
  if (fd < 0) {
    return false;
  }
  struct pollfd pfd {
    fd, POLLIN, 0
  };
  int rc = ::poll(&pfd, 1, wait_ms);
  if (rc <= 0) {
    return false;
  }
  char buf[4096];
  ssize_t n = ::read(fd, buf, sizeof(buf));
  if (n > 0) {
    out.append(buf, static_cast<size_t>(n));
  } else if (n == 0 || errno != EINTR) {
    close_fd(fd);
  }
  return true;
}

} // namespace

ProcessResult SystemProcessRunner::run(const ProcessSpec &spec) {
  ProcessResult result;
  if (spec.argv.empty()) {
    result.error = make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                              "empty command line");
    return result;
  }

  std::vector<char *> cargv;
  for (auto &s : spec.argv) cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  // exec failures are reported through a close-on-exec pipe so that
  // "could not start" is distinct from a child exiting with 127.
  int exec_err_pipe[2] = {-1, -1};
  if (::pipe2(exec_err_pipe, O_CLOEXEC) != 0) {
    result.error = make_error(my_errors::LAUNCH::SPAWN_FAILED,
                              std::string("pipe failed: ") +
                                  std::strerror(errno));
    return result;
  }
  int out_pipe[2] = {-1, -1};
  if (spec.capture_stdout && ::pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.error = make_error(my_errors::LAUNCH::SPAWN_FAILED,
                              std::string("pipe failed: ") +
                                  std::strerror(errno));
    close_fd(exec_err_pipe[0]);
    close_fd(exec_err_pipe[1]);
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    result.error = make_error(my_errors::LAUNCH::SPAWN_FAILED,
                              std::string("fork failed: ") +
                                  std::strerror(errno));
    close_fd(exec_err_pipe[0]);
    close_fd(exec_err_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return result;
  }

  if (pid == 0) {
    // child
    if (spec.capture_stdout) {
      ::dup2(out_pipe[1], STDOUT_FILENO);
    }
    if (!spec.working_dir.empty() &&
        ::chdir(spec.working_dir.c_str()) != 0) {
      int e = errno;
      (void)!::write(exec_err_pipe[1], &e, sizeof(e));
      _exit(127);
    }
    execvp(cargv[0], cargv.data());
    int e = errno;
    (void)!::write(exec_err_pipe[1], &e, sizeof(e));
    _exit(127);
  }

  // parent
  close_fd(exec_err_pipe[1]);
  close_fd(out_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_err_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    result.error = make_error(my_errors::LAUNCH::SPAWN_FAILED,
                              "failed to start '" + spec.argv[0] +
                                  "': " + std::strerror(child_errno));
    return result;
  }

  int status = 0;
  int out_fd = out_pipe[0];
  const auto start = std::chrono::steady_clock::now();
  const auto timeout = std::chrono::milliseconds(spec.timeout_ms);

  if (spec.timeout_ms == 0 && out_fd < 0) {
    pid_t w;
    do {
      w = ::waitpid(pid, &status, 0);
    } while (w == -1 && errno == EINTR);
    if (w == -1) {
      result.error = make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                                std::string("waitpid failed: ") +
                                    std::strerror(errno));
      return result;
    }
  } else {
    while (true) {
      if (out_fd >= 0) {
        pump_fd(out_fd, result.output, 50);
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
      pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid) {
        break;
      }
      if (w == -1 && errno != EINTR) {
        close_fd(out_fd);
        result.error = make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                                  std::string("waitpid failed: ") +
                                      std::strerror(errno));
        return result;
      }
      if (spec.timeout_ms > 0 &&
          std::chrono::steady_clock::now() - start >= timeout) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        close_fd(out_fd);
        result.error = make_error(my_errors::LAUNCH::CHILD_TIMEOUT,
                                  "command timed out");
        return result;
      }
    }
    // A grandchild may keep the pipe open; stop once it goes quiet.
    while (pump_fd(out_fd, result.output, 50)) {
    }
    close_fd(out_fd);
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signal = WTERMSIG(status);
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.error = make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                              "unknown command result");
  }
  return result;
}

#endif

} // namespace devlaunch::launch
