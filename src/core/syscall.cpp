#include "codebox/core/syscall.hpp"

#include "codebox/core/constant.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <expected>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codebox::core::syscall {

auto kill_process(pid_t pid, int signal) -> Result<void> {
  if (kill(pid, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto kill_group(pid_t group_id, int signal) -> Result<void> {
  if (killpg(group_id, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto wait_for_process(pid_t pid) -> Result<ProcessInfo> {
  int   status     = 0;
  pid_t result_pid = -1;
  do {
    result_pid = waitpid(pid, &status, 0);
  } while (result_pid == -1 && errno == EINTR);

  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  return ProcessInfo{result_pid, status};
}

auto has_exited(pid_t pid) -> Result<bool> {
  siginfo_t info{};
  if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
    return std::unexpected(errno);
  }
  return info.si_pid != 0;
}

auto spawn_process(
    std::string const&                program,
    std::vector<std::string> const&   args,
    std::vector<std::string> const&   env,
    posix_spawn_file_actions_t const* file_actions,
    posix_spawnattr_t const*          attr
) -> Result<pid_t> {
  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(program.c_str()));

  for (auto const& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<char*> envp;
  envp.reserve(env.size() + 1);
  for (auto const& entry : env) {
    envp.push_back(const_cast<char*>(entry.c_str()));
  }
  envp.push_back(nullptr);

  pid_t pid = 0;
  if (int result = posix_spawnp(&pid, program.c_str(), file_actions, attr, argv.data(), envp.data())) {
    return std::unexpected(result);
  }
  return pid;
}

auto open_pidfd(pid_t pid) -> Result<int> {
#ifdef SYS_pidfd_open
  long fd = ::syscall(SYS_pidfd_open, pid, 0);
  if (fd == -1) {
    return std::unexpected(errno);
  }
  return static_cast<int>(fd);
#else
  (void)pid;
  return std::unexpected(ENOSYS);
#endif
}

auto poll_fds(std::vector<pollfd>& fds, std::chrono::milliseconds timeout) -> Result<int> {
  auto millis = std::min<long long>(timeout.count(), std::numeric_limits<int>::max());
  int  result = poll(fds.data(), fds.size(), static_cast<int>(millis));
  if (result == -1) {
    return std::unexpected(errno);
  }
  return result;
}

auto close_fd(int fd) -> Result<void> {
  if (close(fd) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t> {
  ssize_t result = read(fd, buffer, size);
  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto set_nonblocking(int fd) -> Result<void> {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto error_message(int code) -> std::string {
  return std::system_category().message(code);
}

auto exit_code_of(int status) noexcept -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return constant::SIGNAL_EXIT_CODE_OFFSET + WTERMSIG(status);
  }
  return -1;
}

} // namespace codebox::core::syscall
