#pragma once

#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace codebox::logging {

// Replaces spdlog's default logger with a stderr logger named "codebox", so
// stdout stays reserved for execution results. Without an explicit level the
// CODEBOX_LOG_LEVEL variable decides, falling back to warnings only.
void init(std::optional<spdlog::level::level_enum> level = std::nullopt);

[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

} // namespace codebox::logging
