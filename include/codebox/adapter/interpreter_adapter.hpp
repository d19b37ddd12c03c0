#pragma once

#include <chrono>

#include "codebox/adapter/adapter.hpp"
#include "codebox/core/constant.hpp"

namespace codebox {

// Runs JavaScript in a fresh QuickJS runtime per call. The global scope holds
// only `input` and a `console` forwarding to the host logger; the runtime is
// destroyed afterwards, so an interrupted runtime is never reused.
class InterpreterAdapter final : public Adapter {
  std::chrono::milliseconds deadline_;

public:
  explicit InterpreterAdapter(std::chrono::milliseconds deadline = core::constant::INTERPRETER_TIMEOUT);

  [[nodiscard]] auto run(ExecutionRequest const& request) const -> ExecutionOutcome override;
};

} // namespace codebox
