#include "codebox/adapter/process_adapter.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "codebox/core/constant.hpp"
#include "codebox/core/env.hpp"
#include "codebox/process/artifact.hpp"
#include "codebox/process/child_process.hpp"
#include "codebox/process/script_template.hpp"

namespace {

using codebox::Json;

auto string_field(Json const& object, char const* key) -> std::string {
  if (auto it = object.find(key); it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

// The wrappers write the structured error as the last JSON line on stderr;
// anything the user code printed comes before it.
auto find_structured_error(std::string_view stderr_text) -> std::optional<Json> {
  size_t end = stderr_text.size();
  while (end > 0) {
    size_t start = stderr_text.rfind('\n', end - 1);
    start        = start == std::string_view::npos ? 0 : start + 1;

    auto line = codebox::core::trim(stderr_text.substr(start, end - start));
    if (line.starts_with('{')) {
      auto parsed = Json::parse(line, nullptr, false);
      if (!parsed.is_discarded() && parsed.is_object()) {
        if (auto it = parsed.find(std::string{codebox::core::constant::ERROR_MARKER}); it != parsed.end() && it->is_object()) {
          return *it;
        }
      }
    }

    if (start == 0) {
      break;
    }
    end = start - 1;
  }
  return std::nullopt;
}

auto python_environment() -> std::vector<std::string> {
  return codebox::core::environment_with({
      {"PYTHONPATH",              ""},
      {"PYTHONUNBUFFERED",        "1"},
      {"PYTHONDONTWRITEBYTECODE", "1"},
  });
}

} // namespace

namespace codebox {

ProcessAdapter::ProcessAdapter(SandboxConfig const& config)
    : python_binary_{config.python_binary_}
    , pip_binary_{config.pip_binary_}
    , shell_binary_{config.shell_binary_}
    , temp_root_{config.temp_root_}
    , install_timeout_{config.install_timeout_} {}

auto ProcessAdapter::run(ExecutionRequest const& request) const -> ExecutionOutcome {
  auto language = parse_language(request.language_);
  if (!language || *language == Language::JavaScript) {
    return ExecutionOutcome::fail(
        ErrorKind::UnsupportedLanguage, fmt::format("Process execution does not support '{}'", request.language_)
    );
  }

  bool const is_python = *language == Language::Python;

  auto artifact = process::ExecutionArtifact::create(temp_root_, is_python ? "main.py" : "main.sh");
  if (!artifact) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, artifact.error());
  }

  auto script = is_python ? process::render_python_wrapper(request.code_, request.input_)
                          : process::render_shell_wrapper(request.code_, request.input_);
  if (auto written = artifact->write_script(script); !written) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, written.error());
  }

  if (is_python && !request.packages_.empty()) {
    install_packages(request.packages_, *artifact);
  }

  auto const& program = is_python ? python_binary_ : shell_binary_;

  process::SpawnOptions options{
      .program_           = program,
      .args_              = {artifact->script_path().string()},
      .env_               = python_environment(),
      .working_directory_ = artifact->work_directory(),
      .capture_output_    = true,
  };

  spdlog::debug("Execution {}: running {} with {}ms budget", artifact->execution_id(), program, request.timeout_.count());

  auto finished = process::run_supervised(options, request.timeout_);
  if (!finished) {
    if (finished.error().is_not_found()) {
      return ExecutionOutcome::fail(
          ErrorKind::ProcessNotFound,
          fmt::format(
              "'{}' is not installed or not in PATH. Set {} to use an external execution service.",
              program,
              core::constant::SERVICE_URL_VAR
          )
      );
    }
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, finished.error().message());
  }

  if (finished->timed_out_) {
    return ExecutionOutcome::fail(
        ErrorKind::Timeout, fmt::format("Execution timed out after {}ms", request.timeout_.count())
    );
  }

  return interpret_process_result(*finished, request.input_);
}

void ProcessAdapter::install_packages(std::set<std::string> const& packages, process::ExecutionArtifact& artifact) const {
  std::string manifest;
  for (auto const& package : packages) {
    manifest += package;
    manifest += '\n';
  }

  if (auto written = artifact.write_manifest(manifest); !written) {
    spdlog::warn("Package installation skipped: {}", written.error());
    return;
  }

  process::SpawnOptions options{
      .program_           = pip_binary_,
      .args_              = {"install", "-q", "-r", artifact.manifest_path()->string()},
      .env_               = core::environment_with({}),
      .working_directory_ = artifact.work_directory(),
      .capture_output_    = false,
  };

  auto installed = process::run_supervised(options, install_timeout_);
  if (!installed) {
    spdlog::warn("Package installation warning: {}", installed.error().message());
  } else if (installed->timed_out_) {
    spdlog::warn("Package installation timed out after {}ms", install_timeout_.count());
  } else if (installed->exit_status_ != 0) {
    spdlog::warn("Package installation failed with code {}", installed->exit_status_);
  } else {
    spdlog::debug("Installed {} package(s) for execution {}", packages.size(), artifact.execution_id());
  }
}

auto interpret_process_result(process::ProcessResult const& result, Json const& input) -> ExecutionOutcome {
  if (result.exit_status_ == 0 && !result.signaled_) {
    auto text = core::trim(result.stdout_);
    if (text.empty()) {
      return ExecutionOutcome::ok(input);
    }

    auto parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
      return ExecutionOutcome::ok(Json(std::move(text)));
    }
    return ExecutionOutcome::ok(std::move(parsed));
  }

  if (auto structured = find_structured_error(result.stderr_)) {
    auto type  = string_field(*structured, "type");
    auto error = string_field(*structured, "error");

    Json details        = std::move(*structured);
    details["exitCode"] = result.exit_status_;

    return ExecutionOutcome::fail(
        ErrorKind::RuntimeFault,
        fmt::format("{}: {}", type.empty() ? "Error" : type, error),
        std::move(details)
    );
  }

  Json details        = Json::object();
  details["exitCode"] = result.exit_status_;
  details["stderr"]   = result.stderr_;
  details["stdout"]   = result.stdout_;
  if (result.signaled_) {
    details["signal"] = result.signal_;
  }

  auto message = core::trim(result.stderr_);
  if (message.empty()) {
    message = fmt::format("Process exited with status {}", result.exit_status_);
  }
  return ExecutionOutcome::fail(ErrorKind::RuntimeFault, std::move(message), std::move(details));
}

} // namespace codebox
