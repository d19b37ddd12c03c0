#pragma once

#include <chrono>
#include <future>
#include <memory>

#include "codebox/adapter/adapter.hpp"
#include "codebox/config.hpp"
#include "codebox/types.hpp"

namespace codebox {

// Single entry point: picks an adapter by language, validates Python and
// shell code first, and turns every failure into an ExecutionOutcome.
class Dispatcher {
  SandboxConfig            config_;
  std::unique_ptr<Adapter> interpreter_;
  std::unique_ptr<Adapter> process_;
  std::unique_ptr<Adapter> remote_; // null when no service endpoint is configured

public:
  explicit Dispatcher(SandboxConfig config);
  Dispatcher(
      SandboxConfig            config,
      std::unique_ptr<Adapter> interpreter,
      std::unique_ptr<Adapter> process,
      std::unique_ptr<Adapter> remote
  );

  Dispatcher(Dispatcher const&)            = delete;
  Dispatcher& operator=(Dispatcher const&) = delete;

  [[nodiscard]] auto execute(ExecutionRequest const& request) const noexcept -> ExecutionOutcome;

  // Runs execute() on its own thread. The dispatcher must outlive the future.
  [[nodiscard]] auto submit(ExecutionRequest request) const -> std::future<ExecutionOutcome>;

  [[nodiscard]] auto config() const noexcept -> SandboxConfig const&;

private:
  // Positive requests are capped; otherwise the configured default, then the built-in one.
  [[nodiscard]] auto effective_timeout(std::chrono::milliseconds requested) const noexcept -> std::chrono::milliseconds;
  [[nodiscard]] auto route(ExecutionRequest const& request) const -> ExecutionOutcome;
};

} // namespace codebox
