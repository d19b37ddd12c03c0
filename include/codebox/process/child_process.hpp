#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "codebox/core/result.hpp"

namespace codebox::process {

struct SpawnOptions {
  std::string                          program_;
  std::vector<std::string>             args_;
  std::vector<std::string>             env_; // "NAME=value"
  std::optional<std::filesystem::path> working_directory_;
  bool                                 capture_output_ = true; // false: stdout/stderr go to /dev/null
};

struct ProcessResult {
  pid_t       pid_         = -1;
  int         exit_status_ = 0;
  bool        signaled_    = false;
  int         signal_      = 0;
  bool        timed_out_   = false;
  std::string stdout_;
  std::string stderr_;
};

class ProcessError {
  std::string message_;
  int         error_code_;

public:
  ProcessError(std::string msg, int code);

  [[nodiscard]] std::string const& message() const noexcept;
  [[nodiscard]] int                error_code() const noexcept;
  [[nodiscard]] bool               is_not_found() const noexcept;
};

// Starts `options.program_` in its own process group and races its exit
// against `timeout`. On timeout the group receives SIGTERM, then SIGKILL after
// a short grace period; the child is always reaped before returning.
auto run_supervised(SpawnOptions const& options, std::chrono::milliseconds timeout)
    -> core::Result<ProcessResult, ProcessError>;

} // namespace codebox::process
