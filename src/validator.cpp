#include "codebox/validator.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>

#include "codebox/core/env.hpp"

namespace {

using codebox::Language;

struct DangerousPattern {
  std::string symbol_;
  std::string description_;
  std::regex  pattern_;
  size_t      symbol_group_ = 0; // capture group naming the symbol, 0 = use symbol_
};

auto python_patterns() -> std::vector<DangerousPattern> const& {
  // Attribute calls such as re.compile() or ast.literal_eval() are not builtins.
  // clang-format off
  static std::vector<DangerousPattern> const patterns = {
    {"__import__", "dynamic import",           std::regex{R"(__import__\s*\()"}},
    {"eval",       "eval() invocation",        std::regex{R"((^|[^\w.])eval\s*\()"}},
    {"exec",       "exec() invocation",        std::regex{R"((^|[^\w.])exec\s*\()"}},
    {"compile",    "compile() invocation",     std::regex{R"((^|[^\w.])compile\s*\()"}},
    {"subprocess", "subprocess usage",         std::regex{R"(\bsubprocess\s*\.)"}},
    {"os.system",  "shell command execution",  std::regex{R"(\bos\s*\.\s*system\b)"}},
    {"os.popen",   "shell command execution",  std::regex{R"(\bos\s*\.\s*popen\b)"}},
    {"socket",     "raw socket construction",  std::regex{R"(\bsocket\s*\.)"}},
  };
  // clang-format on
  return patterns;
}

auto shell_patterns() -> std::vector<DangerousPattern> const& {
  // clang-format off
  static std::vector<DangerousPattern> const patterns = {
    {"/dev/tcp",  "raw network device",    std::regex{R"(/dev/(tcp|udp)/)"}},
    {"network",   "network client",        std::regex{R"((^|[\s;|&(`])(nc|ncat|netcat|curl|wget|ssh|scp|telnet)(\s|[;|&)`]|$))"}, 2},
    {"privilege", "privilege escalation",  std::regex{R"((^|[\s;|&(`])(sudo|su|chroot|mount)(\s|[;|&)`]|$))"}, 2},
    {"fork bomb", "fork bomb",             std::regex{R"(:\s*\(\s*\)\s*\{)"}},
  };
  // clang-format on
  return patterns;
}

// Characters of an open() call examined for a mode argument.
constexpr size_t CALL_SCAN_WINDOW = 4096;

auto is_space(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto is_word_char(char c) -> bool {
  auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) != 0 || uc == '_';
}

auto strip(std::string_view text) -> std::string_view {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

// libstdc++ regex recursion depth grows with the length of a repeated match,
// so every whitespace run is reduced to one space before matching.
auto collapse_whitespace(std::string_view code) -> std::string {
  std::string collapsed;
  collapsed.reserve(code.size());
  for (char c : code) {
    if (!is_space(c)) {
      collapsed.push_back(c);
    } else if (collapsed.empty() || collapsed.back() != ' ') {
      collapsed.push_back(' ');
    }
  }
  return collapsed;
}

// Top-level arguments of the call whose '(' ends just before `start`. A list
// that does not close within the window yields what was seen so far.
auto call_arguments(std::string_view code, size_t start) -> std::vector<std::string_view> {
  std::vector<std::string_view> arguments;

  auto   end   = std::min(code.size(), start + CALL_SCAN_WINDOW);
  int    depth = 0;
  size_t from  = start;

  for (size_t i = start; i < end; ++i) {
    char c = code[i];
    if (c == '\'' || c == '"') {
      for (++i; i < end && code[i] != c; ++i) {
        if (code[i] == '\\') {
          ++i;
        }
      }
    } else if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      if (depth == 0) {
        arguments.push_back(code.substr(from, i - from));
        return arguments;
      }
      --depth;
    } else if (c == ',' && depth == 0) {
      arguments.push_back(code.substr(from, i - from));
      from = i + 1;
    }
  }

  arguments.push_back(code.substr(from, end - from));
  return arguments;
}

// A string literal made of mode letters, at least one of which writes.
auto is_write_mode(std::string_view argument) -> bool {
  auto literal = strip(argument);
  if (literal.size() < 3 || (literal.front() != '\'' && literal.front() != '"') || literal.back() != literal.front()) {
    return false;
  }

  bool writes = false;
  for (char c : literal.substr(1, literal.size() - 2)) {
    if (c == 'w' || c == 'a' || c == 'x' || c == '+') {
      writes = true;
    } else if (c != 'r' && c != 'b' && c != 't') {
      return false;
    }
  }
  return writes;
}

// open(path, 'w') or open(path, mode='a'); the file name itself is never the mode.
auto opens_for_writing(std::string_view code) -> bool {
  constexpr std::string_view name = "open";

  for (auto pos = code.find(name); pos != std::string_view::npos; pos = code.find(name, pos + 1)) {
    if (pos > 0 && is_word_char(code[pos - 1])) {
      continue;
    }
    auto paren = pos + name.size();
    while (paren < code.size() && is_space(code[paren])) {
      ++paren;
    }
    if (paren >= code.size() || code[paren] != '(') {
      continue;
    }

    auto arguments = call_arguments(code, paren + 1);
    if (arguments.size() >= 2 && is_write_mode(arguments[1])) {
      return true;
    }
    for (auto argument : arguments) {
      argument = strip(argument);
      if (!argument.starts_with("mode")) {
        continue;
      }
      auto value = strip(argument.substr(4));
      if (value.starts_with('=') && is_write_mode(value.substr(1))) {
        return true;
      }
    }
  }
  return false;
}

auto is_identifier(std::string_view name) -> bool {
  if (name.empty()) {
    return false;
  }
  auto front = static_cast<unsigned char>(name.front());
  if (std::isalpha(front) == 0 && front != '_') {
    return false;
  }
  for (char c : name.substr(1)) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && uc != '_') {
      return false;
    }
  }
  return true;
}

auto starts_with_keyword(std::string_view statement, std::string_view keyword) -> bool {
  return statement.starts_with(keyword) && statement.size() > keyword.size()
      && std::isspace(static_cast<unsigned char>(statement[keyword.size()])) != 0;
}

// "a.b.c as d" -> "a"
auto top_level_module(std::string_view dotted) -> std::optional<std::string> {
  auto name = codebox::core::trim(dotted);

  if (auto space = name.find_first_of(" \t"); space != std::string::npos) {
    name.resize(space);
  }
  if (auto dot = name.find('.'); dot != std::string::npos) {
    name.resize(dot);
  }
  if (!is_identifier(name)) {
    return std::nullopt;
  }
  return name;
}

void collect_statement_imports(std::string_view statement, std::vector<std::string>& modules) {
  if (starts_with_keyword(statement, "import")) {
    auto rest = statement.substr(6);

    size_t start = 0;
    while (start <= rest.size()) {
      size_t end = rest.find(',', start);
      if (end == std::string_view::npos) {
        end = rest.size();
      }
      if (auto module = top_level_module(rest.substr(start, end - start))) {
        modules.push_back(std::move(*module));
      }
      start = end + 1;
    }
  } else if (starts_with_keyword(statement, "from")) {
    // Relative imports ("from . import x") start with '.' and are skipped.
    if (auto module = top_level_module(statement.substr(4))) {
      modules.push_back(std::move(*module));
    }
  }
}

auto check_module(std::string const& module, codebox::PolicySet const& policy, std::string_view noun)
    -> std::optional<codebox::ValidationVerdict> {
  if (policy.is_denied(module)) {
    return codebox::ValidationVerdict::reject(
        module, fmt::format("Blocked {} '{}' is not allowed for security reasons", noun, module)
    );
  }
  if (!policy.is_permitted(module)) {
    return codebox::ValidationVerdict::reject(
        module, fmt::format("{} '{}' is not in the allowed packages list", noun == "module" ? "Module" : "Package", module)
    );
  }
  return std::nullopt;
}

} // namespace

namespace codebox {

auto ValidationVerdict::allow() -> ValidationVerdict {
  return ValidationVerdict{};
}

auto ValidationVerdict::reject(std::string symbol, std::string reason) -> ValidationVerdict {
  return ValidationVerdict{.allowed_ = false, .violating_symbol_ = std::move(symbol), .reason_ = std::move(reason)};
}

auto extract_imports(std::string_view code) -> std::vector<std::string> {
  std::vector<std::string> modules;

  size_t line_start = 0;
  while (line_start < code.size()) {
    size_t line_end = code.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = code.size();
    }
    auto line = code.substr(line_start, line_end - line_start);

    size_t statement_start = 0;
    while (statement_start <= line.size()) {
      size_t statement_end = line.find(';', statement_start);
      if (statement_end == std::string_view::npos) {
        statement_end = line.size();
      }
      auto statement = core::trim(line.substr(statement_start, statement_end - statement_start));
      collect_statement_imports(statement, modules);
      statement_start = statement_end + 1;
    }

    line_start = line_end + 1;
  }

  return modules;
}

auto validate(std::string_view code, std::set<std::string> const& packages, PolicySet const& policy, Language language)
    -> ValidationVerdict {
  if (language == Language::Python) {
    for (auto const& module : extract_imports(code)) {
      if (auto verdict = check_module(module, policy, "module")) {
        return *verdict;
      }
    }
  }

  auto const& patterns = language == Language::Shell ? shell_patterns() : python_patterns();
  auto        source   = collapse_whitespace(code);
  for (auto const& pattern : patterns) {
    std::smatch match;
    if (std::regex_search(source, match, pattern.pattern_)) {
      auto symbol = pattern.symbol_group_ > 0 ? match[pattern.symbol_group_].str() : pattern.symbol_;
      return ValidationVerdict::reject(
          std::move(symbol), fmt::format("Code contains potentially dangerous operations: {}", pattern.description_)
      );
    }
  }
  if (language == Language::Python && opens_for_writing(code)) {
    return ValidationVerdict::reject("open", "Code contains potentially dangerous operations: file opened for writing");
  }

  for (auto const& package : packages) {
    if (auto verdict = check_module(package, policy, "package")) {
      return *verdict;
    }
  }

  return ValidationVerdict::allow();
}

} // namespace codebox
