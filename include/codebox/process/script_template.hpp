#pragma once

#include <string>
#include <string_view>

#include "codebox/types.hpp"

namespace codebox::process {

// Double-quoted literal, valid both as JSON and as a Python str literal.
auto python_string_literal(std::string_view text) -> std::string;
// Single-quoted POSIX shell literal ('it'\''s').
auto shell_string_literal(std::string_view text) -> std::string;

// The wrappers embed the user code and the input as escaped literals (never
// as spliced source text), print the result as the only stdout line and
// report failures as one {"__error__": {error, type, traceback}} line on stderr.
auto render_python_wrapper(std::string_view code, Json const& input) -> std::string;
auto render_shell_wrapper(std::string_view code, Json const& input) -> std::string;

} // namespace codebox::process
