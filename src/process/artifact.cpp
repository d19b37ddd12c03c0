#include "codebox/process/artifact.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "codebox/core/constant.hpp"

namespace fs = std::filesystem;

namespace {

auto write_file(fs::path const& path, std::string_view contents) -> codebox::core::Result<void> {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(fmt::format("Failed to open {} for writing", path.string()));
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  out.close();
  if (!out) {
    return std::unexpected(fmt::format("Failed to write {}", path.string()));
  }
  return {};
}

} // namespace

namespace codebox::process {

auto generate_execution_id() -> std::string {
  thread_local std::mt19937_64 engine{[] {
    std::random_device                 device;
    std::seed_seq                      seed{device(), device(), device(), device(), device(), device(), device(), device()};
    return std::mt19937_64{seed};
  }()};

  return fmt::format("{:016x}{:016x}", engine(), engine());
}

ExecutionArtifact::ExecutionArtifact(std::string execution_id, fs::path work_directory, fs::path script_path)
    : execution_id_{std::move(execution_id)}
    , work_directory_{std::move(work_directory)}
    , script_path_{std::move(script_path)} {}

ExecutionArtifact::~ExecutionArtifact() {
  remove();
}

ExecutionArtifact::ExecutionArtifact(ExecutionArtifact&& other) noexcept
    : execution_id_{std::move(other.execution_id_)}
    , work_directory_{std::move(other.work_directory_)}
    , script_path_{std::move(other.script_path_)}
    , manifest_path_{std::move(other.manifest_path_)} {
  other.work_directory_.clear();
  other.script_path_.clear();
  other.manifest_path_.reset();
}

ExecutionArtifact& ExecutionArtifact::operator=(ExecutionArtifact&& other) noexcept {
  if (this != &other) {
    remove();
    execution_id_   = std::move(other.execution_id_);
    work_directory_ = std::move(other.work_directory_);
    script_path_    = std::move(other.script_path_);
    manifest_path_  = std::move(other.manifest_path_);
    other.work_directory_.clear();
    other.script_path_.clear();
    other.manifest_path_.reset();
  }
  return *this;
}

auto ExecutionArtifact::create(fs::path const& temp_root, std::string_view script_name) -> core::Result<ExecutionArtifact> {
  auto execution_id = generate_execution_id();
  auto directory    = temp_root / fmt::format("{}{}", core::constant::ARTIFACT_DIR_PREFIX, execution_id);

  std::error_code ec;
  if (!fs::create_directory(directory, ec)) {
    // create_directory() also reports false when the path already exists
    return std::unexpected(fmt::format(
        "Failed to create work directory {}: {}", directory.string(), ec ? ec.message() : "already exists"
    ));
  }

  ExecutionArtifact artifact{std::move(execution_id), directory, directory / script_name};

  fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
  if (ec) {
    return std::unexpected(fmt::format("Failed to restrict {}: {}", directory.string(), ec.message()));
  }

  spdlog::debug("Created execution artifact {}", directory.string());
  return artifact;
}

auto ExecutionArtifact::write_script(std::string_view contents) -> core::Result<void> {
  return write_file(script_path_, contents);
}

auto ExecutionArtifact::write_manifest(std::string_view contents) -> core::Result<void> {
  manifest_path_ = work_directory_ / core::constant::MANIFEST_FILE_NAME;
  return write_file(*manifest_path_, contents);
}

auto ExecutionArtifact::execution_id() const noexcept -> std::string const& {
  return execution_id_;
}

auto ExecutionArtifact::work_directory() const noexcept -> fs::path const& {
  return work_directory_;
}

auto ExecutionArtifact::script_path() const noexcept -> fs::path const& {
  return script_path_;
}

auto ExecutionArtifact::manifest_path() const noexcept -> std::optional<fs::path> const& {
  return manifest_path_;
}

void ExecutionArtifact::remove() noexcept {
  if (work_directory_.empty()) {
    return;
  }

  std::error_code ec;
  fs::remove_all(work_directory_, ec);
  if (ec) {
    spdlog::warn("Failed to remove execution artifact {}: {}", work_directory_.string(), ec.message());
  } else {
    spdlog::debug("Removed execution artifact {}", work_directory_.string());
  }
  work_directory_.clear();
}

} // namespace codebox::process
