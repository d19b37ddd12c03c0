#include "codebox/cli/arg_parser.hpp"

#include <algorithm>
#include <string_view>
#include <utility>
#include <fmt/core.h>

#include "codebox/core/constant.hpp"

namespace codebox::cli {

namespace {

// A lone "-" is a value (stdin), not an option.
auto looks_like_option(std::string_view arg) noexcept -> bool {
  return arg.size() > 1 && arg.starts_with('-');
}

// Consumes up to `count` following arguments that are not options.
auto take_values(int argc, char const** argv, int& i, size_t count) -> std::vector<std::string> {
  std::vector<std::string> values;
  values.reserve(count);
  while (values.size() < count && i + 1 < argc && !looks_like_option(argv[i + 1])) {
    values.emplace_back(argv[++i]);
  }
  return values;
}

} // namespace

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::nargs(size_t n) noexcept -> Option& {
  nargs_ = n;
  return *this;
}

auto Option::default_value(std::string value) noexcept -> Option& {
  default_value_ = {std::move(value)};
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) noexcept -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::parse(int argc, char const** argv) -> core::Result<Arguments> {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (arg == "--") {
      // Everything after a bare "--" is positional
      while (++i < argc) {
        result.positional_.emplace_back(argv[i]);
      }
      break;
    }

    if (arg.starts_with("--")) {
      std::string_view name        = arg.substr(2);
      size_t           eq_pos      = name.find('=');
      std::string_view option_name = name.substr(0, eq_pos);

      auto option_it = std::ranges::find_if(options_, [option_name](Option const& opt) {
        return opt.name_ == option_name;
      });
      if (option_it == options_.end()) {
        return std::unexpected(fmt::format("Unknown option: --{}", option_name));
      }

      if (option_it->nargs_ == 0) {
        if (eq_pos != std::string_view::npos) {
          return std::unexpected(fmt::format("Flag option --{} does not accept a value", option_name));
        }
        result.args_[option_it->name_] = {"true"};
        continue;
      }

      std::vector<std::string> values;
      if (eq_pos != std::string_view::npos) {
        values.emplace_back(name.substr(eq_pos + 1));
      } else {
        values = take_values(argc, argv, i, option_it->nargs_);
      }

      if (values.size() < option_it->nargs_) {
        return std::unexpected(
            fmt::format("Option --{} requires {} argument(s), got {}", option_name, option_it->nargs_, values.size())
        );
      }
      result.args_[option_it->name_] = std::move(values);
    } else if (looks_like_option(arg)) {
      // Bundled short flags; a short option taking a value must come last
      for (size_t j = 1; j < arg.size(); ++j) {
        char short_opt{arg[j]};

        auto option_it = std::ranges::find_if(options_, [short_opt](Option const& opt) {
          return opt.short_name_.size() == 1 && opt.short_name_.front() == short_opt;
        });
        if (option_it == options_.end()) {
          return std::unexpected(fmt::format("Unknown option: -{}", short_opt));
        }

        if (option_it->nargs_ == 0) {
          result.args_[option_it->name_] = {"true"};
          continue;
        }

        if (j < arg.size() - 1) {
          return std::unexpected(
              fmt::format("Option -{} requires a value and cannot be combined with other short options", short_opt)
          );
        }

        auto values = take_values(argc, argv, i, option_it->nargs_);
        if (values.size() < option_it->nargs_) {
          return std::unexpected(
              fmt::format("Option -{} requires {} argument(s), got {}", short_opt, option_it->nargs_, values.size())
          );
        }
        result.args_[option_it->name_] = std::move(values);
      }
    } else {
      result.positional_.emplace_back(arg);
    }
  }

  return result;
}

void ArgumentParser::print_help() const noexcept {
  fmt::print("Usage: {}", name_);
  if (!options_.empty()) {
    fmt::print(" [OPTIONS]");
  }
  fmt::print("\n\n");

  if (!desc_.empty()) {
    fmt::print("{}\n\n", desc_);
  }

  if (options_.empty()) {
    return;
  }

  fmt::print("Options:\n");
  for (auto const& option : options_) {
    fmt::print("  ");

    if (!option.short_name_.empty()) {
      fmt::print("-{}", option.short_name_);
      if (!option.name_.empty()) {
        fmt::print(", ");
      }
    }
    if (!option.name_.empty()) {
      fmt::print("--{}", option.name_);
    }
    if (option.nargs_ > 0) {
      fmt::print(" <value>");
    }

    if (!option.description_.empty()) {
      fmt::print("\n    {}", option.description_);
    }
    if (option.default_value_) {
      fmt::print(" (default: {})", option.default_value_->front());
    }
    fmt::print("\n");
  }
}

void ArgumentParser::print_version() noexcept {
  fmt::print("{} {} {}\n", core::constant::EXE_NAME, core::constant::EXE_DESC, core::constant::VERSION);
}

auto create_default_arg_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser(std::string{core::constant::EXE_NAME}, std::string{core::constant::EXE_DESC});

  parser.add_argument("language", "l")
    .nargs(1)
    .default_value("python")
    .desc("Language of the code: javascript, python or bash");
  parser.add_argument("code", "c")
    .nargs(1)
    .desc("Source code to execute");
  parser.add_argument("file", "f")
    .nargs(1)
    .desc("Read the source code from a file");
  parser.add_argument("input", "i")
    .nargs(1)
    .desc("Input data as a JSON object");
  parser.add_argument("packages", "p")
    .nargs(1)
    .desc("Comma separated packages to install before running Python code");
  parser.add_argument("timeout", "t")
    .nargs(1)
    .desc("Execution timeout in milliseconds");
  parser.add_argument("request", "r")
    .nargs(1)
    .desc("Read a JSON request from a file, or '-' for stdin");
  parser.add_argument("service-url")
    .nargs(1)
    .desc("Delegate Python execution to this service endpoint");
  parser.add_argument("allow")
    .nargs(1)
    .desc("Comma separated package allowlist");
  parser.add_argument("verbose", "v")
    .desc("Enable debug logging");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

} // namespace codebox::cli
