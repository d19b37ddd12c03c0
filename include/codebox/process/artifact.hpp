#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "codebox/core/result.hpp"

namespace codebox::process {

// Fresh random identifier (128 bits, hex encoded).
auto generate_execution_id() -> std::string;

// Per-execution staging directory and the files inside it. Move-only; the
// destructor removes the whole directory, whatever the exit path.
class ExecutionArtifact {
  std::string                          execution_id_;
  std::filesystem::path                work_directory_;
  std::filesystem::path                script_path_;
  std::optional<std::filesystem::path> manifest_path_;

  ExecutionArtifact(std::string execution_id, std::filesystem::path work_directory, std::filesystem::path script_path);

public:
  ~ExecutionArtifact();

  ExecutionArtifact(ExecutionArtifact const&)            = delete;
  ExecutionArtifact& operator=(ExecutionArtifact const&) = delete;

  ExecutionArtifact(ExecutionArtifact&& other) noexcept;
  ExecutionArtifact& operator=(ExecutionArtifact&& other) noexcept;

  // Creates <temp_root>/codebox-<id> with owner-only permissions.
  static auto create(std::filesystem::path const& temp_root, std::string_view script_name)
      -> core::Result<ExecutionArtifact>;

  auto write_script(std::string_view contents) -> core::Result<void>;
  auto write_manifest(std::string_view contents) -> core::Result<void>;

  [[nodiscard]] auto execution_id() const noexcept -> std::string const&;
  [[nodiscard]] auto work_directory() const noexcept -> std::filesystem::path const&;
  [[nodiscard]] auto script_path() const noexcept -> std::filesystem::path const&;
  [[nodiscard]] auto manifest_path() const noexcept -> std::optional<std::filesystem::path> const&;

private:
  void remove() noexcept;
};

} // namespace codebox::process
