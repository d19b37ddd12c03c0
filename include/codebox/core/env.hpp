#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codebox::core {

// Environment variable utilities
std::optional<std::string> getenv_str(std::string_view name);
std::optional<std::chrono::milliseconds> getenv_millis(std::string_view name);

// Snapshot of the current process environment as "NAME=value" entries, with
// the given overrides replacing (or adding) entries of the same name.
std::vector<std::string> environment_with(std::vector<std::pair<std::string, std::string>> const& overrides);

// String helpers
std::string              trim(std::string_view s);
std::string              to_lower(std::string_view s);
std::set<std::string>    split_list(std::string_view list, char separator = ',');

} // namespace codebox::core
