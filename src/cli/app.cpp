#include "codebox/cli/app.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "codebox/core/env.hpp"
#include "codebox/dispatcher.hpp"
#include "codebox/logging.hpp"

namespace codebox::cli {

namespace {

constexpr int EXIT_OK    = 0;
constexpr int EXIT_FAIL  = 1;
constexpr int EXIT_USAGE = 2;

auto read_text(std::string const& path) -> core::Result<std::string> {
  if (path == "-") {
    return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
  }

  std::ifstream file{path, std::ios::binary};
  if (!file) {
    return std::unexpected(fmt::format("Cannot read '{}'", path));
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

auto parse_json(std::string const& text, std::string_view what) -> core::Result<Json> {
  auto parsed = Json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected(fmt::format("{} is not valid JSON", what));
  }
  return parsed;
}

} // namespace

void apply_overrides(Arguments const& args, SandboxConfig& config) {
  if (auto url = args.get<std::string>("service-url")) {
    config.service_url_ = core::trim(*url);
  }
  if (auto allow = args.get<std::string>("allow")) {
    config.policy_ = PolicySet{config.policy_.denylist(), core::split_list(*allow)};
  }
}

auto build_request(Arguments const& args, SandboxConfig const& config) -> core::Result<ExecutionRequest> {
  ExecutionRequest request;
  request.timeout_ = config.default_timeout_;

  if (auto path = args.get<std::string>("request")) {
    auto text = read_text(*path);
    if (!text) {
      return std::unexpected(text.error());
    }
    auto json = parse_json(*text, "Request");
    if (!json) {
      return std::unexpected(json.error());
    }
    auto parsed = request_from_json(*json, config.default_timeout_);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    request = std::move(*parsed);

    // --language always has a default, so only an explicit flag may override
    if (request.language_.empty()) {
      request.language_ = args.get<std::string>("language").value_or("python");
    }
  } else {
    request.language_ = args.get<std::string>("language").value_or("python");
  }

  if (args.has("code") && args.has("file")) {
    return std::unexpected(std::string{"--code and --file are mutually exclusive"});
  }
  if (auto code = args.get<std::string>("code")) {
    request.code_ = *code;
  } else if (auto path = args.get<std::string>("file")) {
    auto text = read_text(*path);
    if (!text) {
      return std::unexpected(text.error());
    }
    request.code_ = std::move(*text);
  }

  if (auto input = args.get<std::string>("input")) {
    auto json = parse_json(*input, "--input");
    if (!json) {
      return std::unexpected(json.error());
    }
    if (!json->is_object()) {
      return std::unexpected(std::string{"--input must be a JSON object"});
    }
    request.input_ = std::move(*json);
  }

  if (auto packages = args.get<std::string>("packages")) {
    request.packages_ = core::split_list(*packages);
  }

  if (args.has("timeout")) {
    auto timeout = args.get<long long>("timeout");
    if (!timeout) {
      return std::unexpected(std::string{"--timeout must be a number of milliseconds"});
    }
    request.timeout_ = *timeout > 0 ? clamp_timeout(std::chrono::milliseconds{*timeout}) : config.default_timeout_;
  }

  return request;
}

auto run_app(int argc, char const** argv) -> int {
  auto parser = create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args.has_value()) {
    fmt::print(stderr, "Error parsing arguments: {}\n", args.error());
    return EXIT_USAGE;
  }

  if (args->has("help")) {
    parser.print_help();
    return EXIT_OK;
  }

  if (args->has("version")) {
    ArgumentParser::print_version();
    return EXIT_OK;
  }

  logging::init(args->has("verbose") ? std::optional{spdlog::level::debug} : std::nullopt);

  auto config = load_config_from_env();
  apply_overrides(*args, config);

  auto request = build_request(*args, config);
  if (!request) {
    fmt::print(stderr, "Error: {}\n", request.error());
    return EXIT_USAGE;
  }

  Dispatcher dispatcher{std::move(config)};
  auto       outcome = dispatcher.execute(*request);

  fmt::print("{}\n", to_json(outcome).dump(2));
  return outcome.success_ ? EXIT_OK : EXIT_FAIL;
}

} // namespace codebox::cli
