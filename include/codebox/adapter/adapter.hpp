#pragma once

#include "codebox/types.hpp"

namespace codebox {

// One interchangeable strategy for executing a request. Implementations hold
// only immutable state, so run() may be called concurrently.
class Adapter {
public:
  Adapter()          = default;
  virtual ~Adapter() = default;

  Adapter(Adapter const&)            = delete;
  Adapter& operator=(Adapter const&) = delete;
  Adapter(Adapter&&)                 = delete;
  Adapter& operator=(Adapter&&)      = delete;

  [[nodiscard]] virtual auto run(ExecutionRequest const& request) const -> ExecutionOutcome = 0;
};

} // namespace codebox
