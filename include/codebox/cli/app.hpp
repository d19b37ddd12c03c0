#pragma once

#include "codebox/cli/arg_parser.hpp"
#include "codebox/config.hpp"
#include "codebox/core/result.hpp"
#include "codebox/types.hpp"

namespace codebox::cli {

// Applies --service-url and --allow on top of the environment configuration.
void apply_overrides(Arguments const& args, SandboxConfig& config);

// Builds the request from --request, or from the individual flags. Flags given
// alongside --request override the corresponding fields.
auto build_request(Arguments const& args, SandboxConfig const& config) -> core::Result<ExecutionRequest>;

// Entry point of the executable. Exit status: 0 on success, 1 when the
// execution failed, 2 on usage errors.
auto run_app(int argc, char const** argv) -> int;

} // namespace codebox::cli
