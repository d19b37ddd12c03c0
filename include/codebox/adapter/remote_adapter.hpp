#pragma once

#include <chrono>
#include <string>

#include "codebox/adapter/adapter.hpp"
#include "codebox/core/constant.hpp"

namespace codebox {

// Delegates execution to an external service: POST <endpoint>/execute with
// {code, input, packages, timeoutMs}. Transport failures and non-2xx
// responses become ServiceUnavailable.
class RemoteAdapter final : public Adapter {
  std::string               endpoint_;
  std::chrono::milliseconds timeout_buffer_;

public:
  explicit RemoteAdapter(
      std::string               endpoint,
      std::chrono::milliseconds timeout_buffer = core::constant::REMOTE_TIMEOUT_BUFFER
  );

  [[nodiscard]] auto run(ExecutionRequest const& request) const -> ExecutionOutcome override;

  [[nodiscard]] auto endpoint() const noexcept -> std::string const&;
  [[nodiscard]] auto execute_url() const -> std::string;
};

// Maps an HTTP status and body onto an outcome.
auto interpret_service_response(long status, std::string const& body) -> ExecutionOutcome;

} // namespace codebox
