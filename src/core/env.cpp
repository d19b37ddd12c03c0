#include "codebox/core/env.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
  extern char** environ; // NOLINT
}

namespace codebox::core {

std::optional<std::string> getenv_str(std::string_view name) {
  std::string key{name};
  if (char const* value = std::getenv(key.c_str()); (value != nullptr) && (*value != '\0')) {
    return std::string{value};
  }
  return std::nullopt;
}

std::optional<std::chrono::milliseconds> getenv_millis(std::string_view name) {
  auto value = getenv_str(name);
  if (!value) {
    return std::nullopt;
  }

  long long millis = 0;
  auto [ptr, ec]   = std::from_chars(value->data(), value->data() + value->size(), millis);
  if (ec != std::errc{} || ptr != value->data() + value->size() || millis <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds{millis};
}

std::vector<std::string> environment_with(std::vector<std::pair<std::string, std::string>> const& overrides) {
  std::vector<std::string> result;

  if (environ != nullptr) {
    for (char** env = environ; *env != nullptr; ++env) {
      std::string_view entry{*env};
      auto             pos = entry.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }

      auto name       = entry.substr(0, pos);
      bool overridden = std::ranges::any_of(overrides, [name](auto const& kv) { return kv.first == name; });
      if (!overridden) {
        result.emplace_back(entry);
      }
    }
  }

  for (auto const& [name, value] : overrides) {
    result.push_back(name + "=" + value);
  }
  return result;
}

std::string trim(std::string_view s) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

  auto first = std::ranges::find_if_not(s, is_space);
  auto last  = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (first >= last) {
    return {};
  }
  return std::string{first, last};
}

std::string to_lower(std::string_view s) {
  std::string result{s};
  std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::set<std::string> split_list(std::string_view list, char separator) {
  std::set<std::string> result;

  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(separator, start);
    if (end == std::string_view::npos) {
      end = list.size();
    }
    if (auto item = trim(list.substr(start, end - start)); !item.empty()) {
      result.insert(std::move(item));
    }
    start = end + 1;
  }
  return result;
}

} // namespace codebox::core
