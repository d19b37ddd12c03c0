#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "codebox/core/constant.hpp"
#include "codebox/core/result.hpp"

namespace codebox {

// Insertion-ordered so that input payloads round-trip key order.
using Json = nlohmann::ordered_json;

enum struct Language {
  JavaScript, // In-process interpreter
  Python,     // Child process or remote service
  Shell       // Child process
};

[[nodiscard]] auto parse_language(std::string_view name) -> std::optional<Language>;
[[nodiscard]] auto to_string(Language language) noexcept -> std::string_view;

enum struct ErrorKind {
  MissingCode,
  UnsupportedLanguage,
  SecurityViolation,
  RuntimeFault,
  ProcessNotFound,
  Timeout,
  ServiceUnavailable
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

struct ExecutionRequest {
  std::string               language_;
  std::string               code_;
  Json                      input_    = Json::object();
  std::set<std::string>     packages_;
  std::chrono::milliseconds timeout_  = core::constant::DEFAULT_EXECUTION_TIMEOUT;
};

// Caps `timeout` at MAX_EXECUTION_TIMEOUT.
[[nodiscard]] auto clamp_timeout(std::chrono::milliseconds timeout) noexcept -> std::chrono::milliseconds;

// Accepts {language, code, input, packages, timeoutMs}; "timeout" is an alias
// of "timeoutMs". A missing or non-positive timeout falls back to `default_timeout`,
// a non-integer one is an error and larger ones are capped at MAX_EXECUTION_TIMEOUT.
auto request_from_json(
    Json const&               json,
    std::chrono::milliseconds default_timeout = core::constant::DEFAULT_EXECUTION_TIMEOUT
) -> core::Result<ExecutionRequest>;

struct ExecutionError {
  ErrorKind           kind_;
  std::string         message_;
  std::optional<Json> details_;
};

struct ExecutionOutcome {
  bool                          success_ = false;
  std::optional<Json>           output_;
  std::optional<ExecutionError> error_;

  [[nodiscard]] static auto ok(Json value) -> ExecutionOutcome;
  [[nodiscard]] static auto fail(ErrorKind kind, std::string message, std::optional<Json> details = std::nullopt)
      -> ExecutionOutcome;

  // Value under output.output, if any.
  [[nodiscard]] auto value() const -> Json const*;
  [[nodiscard]] auto error_kind() const noexcept -> std::optional<ErrorKind>;
};

[[nodiscard]] auto to_json(ExecutionOutcome const& outcome) -> Json;

} // namespace codebox
