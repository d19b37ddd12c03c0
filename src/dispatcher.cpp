#include "codebox/dispatcher.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "codebox/adapter/interpreter_adapter.hpp"
#include "codebox/adapter/process_adapter.hpp"
#include "codebox/adapter/remote_adapter.hpp"
#include "codebox/core/constant.hpp"
#include "codebox/core/env.hpp"
#include "codebox/validator.hpp"

namespace codebox {

namespace {

auto make_remote(SandboxConfig const& config) -> std::unique_ptr<Adapter> {
  if (!config.service_url_ || config.service_url_->empty()) {
    return nullptr;
  }
  return std::make_unique<RemoteAdapter>(*config.service_url_);
}

} // namespace

Dispatcher::Dispatcher(SandboxConfig config)
    : config_(std::move(config))
    , interpreter_(std::make_unique<InterpreterAdapter>(config_.interpreter_timeout_))
    , process_(std::make_unique<ProcessAdapter>(config_))
    , remote_(make_remote(config_)) {}

Dispatcher::Dispatcher(
    SandboxConfig            config,
    std::unique_ptr<Adapter> interpreter,
    std::unique_ptr<Adapter> process,
    std::unique_ptr<Adapter> remote
)
    : config_(std::move(config))
    , interpreter_(std::move(interpreter))
    , process_(std::move(process))
    , remote_(std::move(remote)) {}

auto Dispatcher::config() const noexcept -> SandboxConfig const& {
  return config_;
}

auto Dispatcher::execute(ExecutionRequest const& request) const noexcept -> ExecutionOutcome {
  try {
    return route(request);
  } catch (std::exception const& e) {
    spdlog::error("Execution failed with an unexpected exception: {}", e.what());
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, e.what());
  } catch (...) {
    spdlog::error("Execution failed with an unknown exception");
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, "Unknown execution failure");
  }
}

auto Dispatcher::submit(ExecutionRequest request) const -> std::future<ExecutionOutcome> {
  return std::async(std::launch::async, [this, request = std::move(request)] { return execute(request); });
}

auto Dispatcher::effective_timeout(std::chrono::milliseconds requested) const noexcept -> std::chrono::milliseconds {
  if (requested.count() > 0) {
    return clamp_timeout(requested);
  }
  if (config_.default_timeout_.count() > 0) {
    return clamp_timeout(config_.default_timeout_);
  }
  return core::constant::DEFAULT_EXECUTION_TIMEOUT;
}

auto Dispatcher::route(ExecutionRequest const& request) const -> ExecutionOutcome {
  if (core::trim(request.code_).empty()) {
    return ExecutionOutcome::fail(ErrorKind::MissingCode, "Code is required");
  }

  auto language = parse_language(request.language_);
  if (!language) {
    return ExecutionOutcome::fail(
        ErrorKind::UnsupportedLanguage, fmt::format("Unsupported language: {}", request.language_)
    );
  }

  auto effective     = request;
  effective.timeout_ = effective_timeout(request.timeout_);

  if (*language == Language::JavaScript) {
    spdlog::debug("Routing to the JavaScript interpreter");
    return interpreter_->run(effective);
  }

  auto verdict = validate(effective.code_, effective.packages_, config_.policy_, *language);
  if (!verdict.allowed_) {
    auto symbol = verdict.violating_symbol_.value_or("");
    spdlog::info("Rejected {} code: {}", to_string(*language), symbol);

    Json details      = Json::object();
    details["symbol"] = symbol;
    return ExecutionOutcome::fail(
        ErrorKind::SecurityViolation, verdict.reason_.value_or("Security violation"), std::move(details)
    );
  }

  if (*language == Language::Python && remote_) {
    spdlog::debug("Routing Python to the execution service");
    return remote_->run(effective);
  }

  spdlog::debug("Routing {} to a child process", to_string(*language));
  return process_->run(effective);
}

} // namespace codebox
