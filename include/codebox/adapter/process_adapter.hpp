#pragma once

#include <chrono>
#include <filesystem>
#include <set>
#include <string>

#include "codebox/adapter/adapter.hpp"
#include "codebox/config.hpp"
#include "codebox/process/artifact.hpp"
#include "codebox/process/child_process.hpp"

namespace codebox {

// Executes Python or Bash code in a supervised child process:
// staging -> dependency install -> spawn -> supervision -> parsing -> cleanup.
class ProcessAdapter final : public Adapter {
  std::string               python_binary_;
  std::string               pip_binary_;
  std::string               shell_binary_;
  std::filesystem::path     temp_root_;
  std::chrono::milliseconds install_timeout_;

public:
  explicit ProcessAdapter(SandboxConfig const& config);

  [[nodiscard]] auto run(ExecutionRequest const& request) const -> ExecutionOutcome override;

private:
  void install_packages(std::set<std::string> const& packages, process::ExecutionArtifact& artifact) const;
};

// Maps a finished child process onto an outcome: exit 0 parses stdout (empty
// yields `input`, non-JSON yields the raw text); anything else is a runtime
// fault, described by the structured error line on stderr when present.
auto interpret_process_result(process::ProcessResult const& result, Json const& input) -> ExecutionOutcome;

} // namespace codebox
