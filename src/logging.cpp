#include "codebox/logging.hpp"

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "codebox/core/constant.hpp"
#include "codebox/core/env.hpp"

namespace codebox::logging {

void init(std::optional<spdlog::level::level_enum> level) {
  auto logger = spdlog::get("codebox");
  if (!logger) {
    logger = spdlog::stderr_color_mt("codebox");
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

  if (!level) {
    if (auto name = core::getenv_str(core::constant::LOG_LEVEL_VAR)) {
      level = parse_level(*name);
    }
  }
  logger->set_level(level.value_or(spdlog::level::warn));

  spdlog::set_default_logger(std::move(logger));
}

auto parse_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
  auto lowered = core::to_lower(core::trim(name));
  if (lowered == "warning") {
    return spdlog::level::warn;
  }

  auto level = spdlog::level::from_str(lowered);
  // from_str() maps unknown names to "off"
  if (level == spdlog::level::off && lowered != "off") {
    return std::nullopt;
  }
  return level;
}

} // namespace codebox::logging
