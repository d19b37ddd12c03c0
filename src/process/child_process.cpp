#include "codebox/process/child_process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "codebox/core/constant.hpp"
#include "codebox/core/file_descriptor.hpp"
#include "codebox/core/syscall.hpp"

namespace {

namespace constant = codebox::core::constant;
namespace syscall  = codebox::core::syscall;

using codebox::core::FileDescriptor;
using codebox::process::ProcessError;

using Clock = std::chrono::steady_clock;

class SpawnFileActions {
  posix_spawn_file_actions_t actions_{};

public:
  SpawnFileActions() {
    posix_spawn_file_actions_init(&actions_);
  }

  ~SpawnFileActions() {
    posix_spawn_file_actions_destroy(&actions_);
  }

  SpawnFileActions(SpawnFileActions const&)            = delete;
  SpawnFileActions& operator=(SpawnFileActions const&) = delete;

  [[nodiscard]] auto get() noexcept -> posix_spawn_file_actions_t* {
    return &actions_;
  }
};

class SpawnAttributes {
  posix_spawnattr_t attr_{};

public:
  SpawnAttributes() {
    posix_spawnattr_init(&attr_);
  }

  ~SpawnAttributes() {
    posix_spawnattr_destroy(&attr_);
  }

  SpawnAttributes(SpawnAttributes const&)            = delete;
  SpawnAttributes& operator=(SpawnAttributes const&) = delete;

  [[nodiscard]] auto get() noexcept -> posix_spawnattr_t* {
    return &attr_;
  }
};

struct OutputStream {
  FileDescriptor fd_;
  std::string*   buffer_;
  bool           open_ = true;
};

// Reads whatever is available without blocking; marks the stream closed on EOF.
void drain(OutputStream& stream) {
  std::array<char, constant::DEFAULT_PIPE_BUFFER_SIZE> chunk{};

  while (stream.open_) {
    auto result = syscall::read_fd(stream.fd_.get(), chunk.data(), chunk.size());
    if (!result) {
      if (result.error() == EINTR) {
        continue;
      }
      if (result.error() != EAGAIN && result.error() != EWOULDBLOCK) {
        stream.open_ = false;
      }
      return;
    }
    if (*result == 0) {
      stream.open_ = false;
      return;
    }

    auto room = constant::MAX_CAPTURED_OUTPUT - std::min(stream.buffer_->size(), constant::MAX_CAPTURED_OUTPUT);
    stream.buffer_->append(chunk.data(), std::min(*result, room));
  }
}

auto check(int rc, char const* what) -> codebox::core::Result<void, ProcessError> {
  if (rc != 0) {
    return std::unexpected(ProcessError{fmt::format("{}: {}", what, syscall::error_message(rc)), rc});
  }
  return {};
}

void signal_group(pid_t pid, int signal) {
  if (auto result = syscall::kill_group(pid, signal); !result && result.error() != ESRCH) {
    spdlog::debug("killpg({}, {}) failed: {}", pid, signal, syscall::error_message(result.error()));
    [[maybe_unused]] auto _ = syscall::kill_process(pid, signal);
  }
}

auto exited(pid_t pid) -> bool {
  auto result = syscall::has_exited(pid);
  // ECHILD means somebody else already reaped it
  return result ? *result : result.error() == ECHILD;
}

// SIGTERM first, SIGKILL to the whole group once the leader is gone or the
// grace period is over. The unreaped leader keeps the group id reserved.
void terminate(pid_t pid) {
  signal_group(pid, SIGTERM);

  auto grace_deadline = Clock::now() + constant::SIGTERM_GRACE_PERIOD;
  while (!exited(pid) && Clock::now() < grace_deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }

  signal_group(pid, SIGKILL);
}

auto configure_io(
    SpawnFileActions&                                          actions,
    codebox::process::SpawnOptions const&                      options,
    std::optional<std::pair<FileDescriptor, FileDescriptor>>&  stdout_pipe,
    std::optional<std::pair<FileDescriptor, FileDescriptor>>&  stderr_pipe
) -> codebox::core::Result<void, ProcessError> {
  if (auto rc = check(
          posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0), "stdin redirect"
      );
      !rc) {
    return rc;
  }

  if (options.capture_output_) {
    auto out = codebox::core::make_pipe();
    auto err = codebox::core::make_pipe();
    if (!out || !err) {
      return std::unexpected(ProcessError{out ? err.error() : out.error(), EMFILE});
    }
    stdout_pipe = std::move(*out);
    stderr_pipe = std::move(*err);

    if (auto rc = check(
            posix_spawn_file_actions_adddup2(actions.get(), stdout_pipe->second.get(), STDOUT_FILENO), "stdout redirect"
        );
        !rc) {
      return rc;
    }
    if (auto rc = check(
            posix_spawn_file_actions_adddup2(actions.get(), stderr_pipe->second.get(), STDERR_FILENO), "stderr redirect"
        );
        !rc) {
      return rc;
    }
  } else {
    for (int fd : {STDOUT_FILENO, STDERR_FILENO}) {
      if (auto rc = check(
              posix_spawn_file_actions_addopen(actions.get(), fd, "/dev/null", O_WRONLY, 0), "output redirect"
          );
          !rc) {
        return rc;
      }
    }
  }

  if (options.working_directory_) {
    if (auto rc = check(
            posix_spawn_file_actions_addchdir_np(actions.get(), options.working_directory_->c_str()), "chdir"
        );
        !rc) {
      return rc;
    }
  }

  return {};
}

auto configure_attributes(SpawnAttributes& attributes) -> codebox::core::Result<void, ProcessError> {
  sigset_t empty_mask;
  sigemptyset(&empty_mask);

  sigset_t default_signals;
  sigemptyset(&default_signals);
  for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGQUIT, SIGHUP, SIGCHLD}) {
    sigaddset(&default_signals, sig);
  }

  short flags = POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;

  if (auto rc = check(posix_spawnattr_setflags(attributes.get(), flags), "spawn flags"); !rc) {
    return rc;
  }
  if (auto rc = check(posix_spawnattr_setpgroup(attributes.get(), 0), "process group"); !rc) {
    return rc;
  }
  if (auto rc = check(posix_spawnattr_setsigmask(attributes.get(), &empty_mask), "signal mask"); !rc) {
    return rc;
  }
  return check(posix_spawnattr_setsigdefault(attributes.get(), &default_signals), "signal defaults");
}

} // namespace

namespace codebox::process {

ProcessError::ProcessError(std::string msg, int code)
    : message_(std::move(msg)), error_code_(code) {}

std::string const& ProcessError::message() const noexcept {
  return message_;
}

int ProcessError::error_code() const noexcept {
  return error_code_;
}

bool ProcessError::is_not_found() const noexcept {
  return error_code_ == ENOENT;
}

auto run_supervised(SpawnOptions const& options, std::chrono::milliseconds timeout)
    -> core::Result<ProcessResult, ProcessError> {
  SpawnFileActions actions;
  SpawnAttributes  attributes;

  std::optional<std::pair<FileDescriptor, FileDescriptor>> stdout_pipe;
  std::optional<std::pair<FileDescriptor, FileDescriptor>> stderr_pipe;

  if (auto configured = configure_io(actions, options, stdout_pipe, stderr_pipe); !configured) {
    return std::unexpected(configured.error());
  }
  if (auto configured = configure_attributes(attributes); !configured) {
    return std::unexpected(configured.error());
  }

  spdlog::debug("Spawning '{}' with {} argument(s)", options.program_, options.args_.size());

  auto spawned = syscall::spawn_process(options.program_, options.args_, options.env_, actions.get(), attributes.get());
  if (!spawned) {
    return std::unexpected(ProcessError{
        fmt::format("Failed to start '{}': {}", options.program_, syscall::error_message(spawned.error())), spawned.error()
    });
  }

  pid_t         pid = *spawned;
  ProcessResult result;
  result.pid_ = pid;

  std::vector<OutputStream> streams;
  if (stdout_pipe && stderr_pipe) {
    // Only the child keeps the write ends
    stdout_pipe->second.reset();
    stderr_pipe->second.reset();
    streams.push_back(OutputStream{std::move(stdout_pipe->first), &result.stdout_});
    streams.push_back(OutputStream{std::move(stderr_pipe->first), &result.stderr_});
  }

  FileDescriptor pidfd;
  if (auto fd = syscall::open_pidfd(pid)) {
    pidfd.reset(*fd);
  }

  auto deadline  = Clock::now() + std::min(timeout, constant::MAX_EXECUTION_TIMEOUT);
  bool has_ended = false;

  while (!has_ended) {
    auto now = Clock::now();
    if (now >= deadline) {
      result.timed_out_ = true;
      break;
    }

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
    auto slice     = pidfd.valid() ? remaining : std::min(remaining, constant::EXIT_POLL_INTERVAL);

    std::vector<pollfd> fds;
    if (pidfd.valid()) {
      fds.push_back(pollfd{.fd = pidfd.get(), .events = POLLIN, .revents = 0});
    }
    for (auto const& stream : streams) {
      fds.push_back(pollfd{.fd = stream.open_ ? stream.fd_.get() : -1, .events = POLLIN, .revents = 0});
    }

    auto polled = syscall::poll_fds(fds, slice);
    if (!polled) {
      if (polled.error() == EINTR) {
        continue;
      }
      terminate(pid);
      [[maybe_unused]] auto _ = syscall::wait_for_process(pid);
      return std::unexpected(
          ProcessError{fmt::format("poll failed while supervising '{}': {}", options.program_, syscall::error_message(polled.error())),
                       polled.error()}
      );
    }

    size_t offset = pidfd.valid() ? 1 : 0;
    for (size_t i = 0; i < streams.size(); ++i) {
      if ((fds[offset + i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        drain(streams[i]);
      }
    }

    if (pidfd.valid()) {
      has_ended = (fds[0].revents & POLLIN) != 0;
    } else {
      has_ended = exited(pid);
    }
  }

  if (result.timed_out_) {
    spdlog::debug("'{}' (pid {}) exceeded {}ms, terminating", options.program_, pid, timeout.count());
    terminate(pid);
  } else {
    // The child is a zombie until reaped, so its group id cannot be reused yet.
    signal_group(pid, SIGKILL);
  }

  auto info = syscall::wait_for_process(pid);

  for (auto& stream : streams) {
    drain(stream);
  }

  if (!info) {
    return std::unexpected(
        ProcessError{fmt::format("waitpid({}) failed: {}", pid, syscall::error_message(info.error())), info.error()}
    );
  }

  result.exit_status_ = syscall::exit_code_of(info->status_);
  result.signaled_    = WIFSIGNALED(info->status_);
  result.signal_      = result.signaled_ ? WTERMSIG(info->status_) : 0;

  return result;
}

} // namespace codebox::process
