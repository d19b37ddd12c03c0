#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "codebox/core/constant.hpp"
#include "codebox/policy.hpp"

namespace codebox {

struct SandboxConfig {
  PolicySet                  policy_ = PolicySet::with_defaults();
  std::optional<std::string> service_url_;

  std::string python_binary_ = std::string{core::constant::DEFAULT_PYTHON_BINARY};
  std::string pip_binary_    = std::string{core::constant::DEFAULT_PIP_BINARY};
  std::string shell_binary_  = std::string{core::constant::DEFAULT_SHELL_BINARY};

  std::filesystem::path temp_root_ = std::filesystem::temp_directory_path();

  std::chrono::milliseconds interpreter_timeout_ = core::constant::INTERPRETER_TIMEOUT;
  std::chrono::milliseconds install_timeout_     = core::constant::INSTALL_TIMEOUT;
  std::chrono::milliseconds default_timeout_     = core::constant::DEFAULT_EXECUTION_TIMEOUT;
};

// Reads the CODEBOX_* / PYTHON_* variables once; unset variables keep defaults.
auto load_config_from_env() -> SandboxConfig;

} // namespace codebox
