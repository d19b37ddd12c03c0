#include "codebox/config.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>
#include <utility>

#include "codebox/core/constant.hpp"
#include "codebox/core/env.hpp"

namespace codebox {

auto load_config_from_env() -> SandboxConfig {
  using namespace core::constant;

  SandboxConfig config;

  std::set<std::string> allowlist;
  if (auto value = core::getenv_str(ALLOWED_PACKAGES_VAR)) {
    allowlist = core::split_list(*value);
  }
  std::set<std::string> extra_denied;
  if (auto value = core::getenv_str(DENYLIST_VAR)) {
    extra_denied = core::split_list(*value);
  }
  config.policy_ = PolicySet::with_defaults(std::move(extra_denied), std::move(allowlist));

  if (auto value = core::getenv_str(SERVICE_URL_VAR)) {
    config.service_url_ = core::trim(*value);
  }

  if (auto value = core::getenv_str(PYTHON_BINARY_VAR)) {
    config.python_binary_ = *value;
  }
  if (auto value = core::getenv_str(PIP_BINARY_VAR)) {
    config.pip_binary_ = *value;
  }
  if (auto value = core::getenv_str(SHELL_BINARY_VAR)) {
    config.shell_binary_ = *value;
  }
  if (auto value = core::getenv_str(TMPDIR_VAR)) {
    config.temp_root_ = std::filesystem::path{*value};
  }

  if (auto value = core::getenv_millis(JS_TIMEOUT_VAR)) {
    config.interpreter_timeout_ = std::min(*value, MAX_EXECUTION_TIMEOUT);
  }
  if (auto value = core::getenv_millis(INSTALL_TIMEOUT_VAR)) {
    config.install_timeout_ = std::min(*value, MAX_EXECUTION_TIMEOUT);
  }
  if (auto value = core::getenv_millis(DEFAULT_TIMEOUT_VAR)) {
    config.default_timeout_ = std::min(*value, MAX_EXECUTION_TIMEOUT);
  }

  return config;
}

} // namespace codebox
