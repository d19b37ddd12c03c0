#include "codebox/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/core.h>

#include "codebox/core/env.hpp"

namespace codebox {

auto clamp_timeout(std::chrono::milliseconds timeout) noexcept -> std::chrono::milliseconds {
  return std::min(timeout, core::constant::MAX_EXECUTION_TIMEOUT);
}

auto parse_language(std::string_view name) -> std::optional<Language> {
  auto lowered = core::to_lower(core::trim(name));

  if (lowered == "javascript" || lowered == "js" || lowered == "node") {
    return Language::JavaScript;
  }
  if (lowered == "python" || lowered == "python3" || lowered == "py") {
    return Language::Python;
  }
  if (lowered == "bash" || lowered == "shell" || lowered == "sh") {
    return Language::Shell;
  }
  return std::nullopt;
}

auto to_string(Language language) noexcept -> std::string_view {
  switch (language) {
    case Language::JavaScript:
      return "javascript";
    case Language::Python:
      return "python";
    case Language::Shell:
      return "bash";
  }
  return "unknown";
}

auto to_string(ErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
    case ErrorKind::MissingCode:
      return "MISSING_CODE";
    case ErrorKind::UnsupportedLanguage:
      return "UNSUPPORTED_LANGUAGE";
    case ErrorKind::SecurityViolation:
      return "SECURITY_VIOLATION";
    case ErrorKind::RuntimeFault:
      return "RUNTIME_FAULT";
    case ErrorKind::ProcessNotFound:
      return "PROCESS_NOT_FOUND";
    case ErrorKind::Timeout:
      return "TIMEOUT";
    case ErrorKind::ServiceUnavailable:
      return "SERVICE_UNAVAILABLE";
  }
  return "UNKNOWN";
}

auto request_from_json(Json const& json, std::chrono::milliseconds default_timeout) -> core::Result<ExecutionRequest> {
  if (!json.is_object()) {
    return std::unexpected("Request must be a JSON object");
  }

  ExecutionRequest request;
  request.timeout_ = default_timeout;

  if (auto it = json.find("language"); it != json.end()) {
    if (!it->is_string()) {
      return std::unexpected("Field 'language' must be a string");
    }
    request.language_ = it->get<std::string>();
  }

  if (auto it = json.find("code"); it != json.end() && !it->is_null()) {
    if (!it->is_string()) {
      return std::unexpected("Field 'code' must be a string");
    }
    request.code_ = it->get<std::string>();
  }

  if (auto it = json.find("input"); it != json.end() && !it->is_null()) {
    if (!it->is_object()) {
      return std::unexpected("Field 'input' must be an object");
    }
    request.input_ = *it;
  }

  if (auto it = json.find("packages"); it != json.end() && !it->is_null()) {
    if (!it->is_array()) {
      return std::unexpected("Field 'packages' must be an array of strings");
    }
    for (auto const& package : *it) {
      if (!package.is_string()) {
        return std::unexpected("Field 'packages' must be an array of strings");
      }
      if (auto name = core::trim(package.get<std::string>()); !name.empty()) {
        request.packages_.insert(std::move(name));
      }
    }
  }

  auto timeout_it = json.find("timeoutMs");
  if (timeout_it == json.end()) {
    timeout_it = json.find("timeout");
  }
  if (timeout_it != json.end() && !timeout_it->is_null()) {
    if (!timeout_it->is_number_integer()) {
      return std::unexpected("Field 'timeoutMs' must be an integer number of milliseconds");
    }
    auto millis = timeout_it->is_number_unsigned()
                    ? static_cast<long long>(std::min<std::uint64_t>(
                          timeout_it->get<std::uint64_t>(), core::constant::MAX_EXECUTION_TIMEOUT.count()
                      ))
                    : timeout_it->get<long long>();
    if (millis > 0) {
      request.timeout_ = clamp_timeout(std::chrono::milliseconds{millis});
    }
  }

  return request;
}

auto ExecutionOutcome::ok(Json value) -> ExecutionOutcome {
  Json output      = Json::object();
  output["output"] = std::move(value);
  return ExecutionOutcome{.success_ = true, .output_ = std::move(output), .error_ = std::nullopt};
}

auto ExecutionOutcome::fail(ErrorKind kind, std::string message, std::optional<Json> details) -> ExecutionOutcome {
  return ExecutionOutcome{
      .success_ = false,
      .output_  = std::nullopt,
      .error_   = ExecutionError{.kind_ = kind, .message_ = std::move(message), .details_ = std::move(details)}
  };
}

auto ExecutionOutcome::value() const -> Json const* {
  if (!output_) {
    return nullptr;
  }
  if (auto it = output_->find("output"); it != output_->end()) {
    return &*it;
  }
  return nullptr;
}

auto ExecutionOutcome::error_kind() const noexcept -> std::optional<ErrorKind> {
  if (!error_) {
    return std::nullopt;
  }
  return error_->kind_;
}

auto to_json(ExecutionOutcome const& outcome) -> Json {
  Json json       = Json::object();
  json["success"] = outcome.success_;

  if (outcome.output_) {
    json["output"] = *outcome.output_;
  }

  if (outcome.error_) {
    Json error       = Json::object();
    error["kind"]    = std::string{to_string(outcome.error_->kind_)};
    error["message"] = outcome.error_->message_;
    if (outcome.error_->details_) {
      error["details"] = *outcome.error_->details_;
    }
    json["error"] = std::move(error);
  }

  return json;
}

} // namespace codebox
