#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

#include <poll.h>
#include <spawn.h>
#include <sys/types.h>

namespace codebox::core::syscall {

template<typename T>
using Result = std::expected<T, int>;

struct ProcessInfo {
  pid_t pid_;
  int   status_;
};

auto kill_process(pid_t pid, int signal) -> Result<void>;
auto kill_group(pid_t group_id, int signal) -> Result<void>;
auto wait_for_process(pid_t pid) -> Result<ProcessInfo>;
// Reports whether the child has exited without reaping it (WNOWAIT).
auto has_exited(pid_t pid) -> Result<bool>;
auto spawn_process(
    std::string const&                program,
    std::vector<std::string> const&   args,
    std::vector<std::string> const&   env,
    posix_spawn_file_actions_t const* file_actions = nullptr,
    posix_spawnattr_t const*          attr         = nullptr
) -> Result<pid_t>;

// Returns a descriptor that becomes readable once the process exits (Linux 5.3+).
auto open_pidfd(pid_t pid) -> Result<int>;
auto poll_fds(std::vector<pollfd>& fds, std::chrono::milliseconds timeout) -> Result<int>;

auto close_fd(int fd) -> Result<void>;
auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t>;
auto set_nonblocking(int fd) -> Result<void>;

// Thread-safe description of an errno value.
[[nodiscard]] auto error_message(int code) -> std::string;

// Decodes a waitpid status into an exit code, mapping signals to 128 + signo.
[[nodiscard]] auto exit_code_of(int status) noexcept -> int;

} // namespace codebox::core::syscall
