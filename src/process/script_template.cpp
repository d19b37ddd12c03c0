#include "codebox/process/script_template.hpp"

#include <string>
#include <string_view>
#include <fmt/core.h>

#include "codebox/core/constant.hpp"

namespace {

auto dump_input(codebox::Json const& input) -> std::string {
  return input.dump(-1, ' ', false, codebox::Json::error_handler_t::replace);
}

// clang-format off
constexpr std::string_view PYTHON_WRAPPER = R"(import contextlib
import json
import sys
import traceback

__codebox_input = json.loads({input})
__codebox_source = {code}


def __codebox_run():
    scope = {{"__name__": "__main__", "input_data": __codebox_input, "input": __codebox_input}}
    with contextlib.redirect_stdout(sys.stderr):
        exec(compile(__codebox_source, "<user-code>", "exec"), scope)
    return scope.get("result", __codebox_input)


try:
    __codebox_output = json.dumps(__codebox_run(), default=str)
except Exception as exc:
    sys.stderr.write(json.dumps({{"{marker}": {{
        "error": str(exc),
        "type": type(exc).__name__,
        "traceback": traceback.format_exc(),
    }}}}) + "\n")
    sys.exit(1)

sys.stdout.write(__codebox_output + "\n")
)";

constexpr std::string_view SHELL_WRAPPER = R"(INPUT={input}
export INPUT
__codebox_source={code}

( eval "$__codebox_source" )
__codebox_status=$?

if [ "$__codebox_status" -ne 0 ]; then
  printf '{{"{marker}": {{"error": "Script exited with status %d", "type": "ShellError", "traceback": ""}}}}\n' "$__codebox_status" >&2
  exit "$__codebox_status"
fi
)";
// clang-format on

} // namespace

namespace codebox::process {

auto python_string_literal(std::string_view text) -> std::string {
  return Json(std::string{text}).dump(-1, ' ', false, Json::error_handler_t::replace);
}

auto shell_string_literal(std::string_view text) -> std::string {
  std::string literal;
  literal.reserve(text.size() + 2);
  literal.push_back('\'');
  for (char c : text) {
    if (c == '\'') {
      literal.append(R"('\'')");
    } else {
      literal.push_back(c);
    }
  }
  literal.push_back('\'');
  return literal;
}

auto render_python_wrapper(std::string_view code, Json const& input) -> std::string {
  return fmt::format(
      fmt::runtime(PYTHON_WRAPPER),
      fmt::arg("input", python_string_literal(dump_input(input))),
      fmt::arg("code", python_string_literal(code)),
      fmt::arg("marker", core::constant::ERROR_MARKER)
  );
}

auto render_shell_wrapper(std::string_view code, Json const& input) -> std::string {
  return fmt::format(
      fmt::runtime(SHELL_WRAPPER),
      fmt::arg("input", shell_string_literal(dump_input(input))),
      fmt::arg("code", shell_string_literal(code)),
      fmt::arg("marker", core::constant::ERROR_MARKER)
  );
}

} // namespace codebox::process
