#include "codebox/adapter/interpreter_adapter.hpp"

#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "quickjs.h"

#include "codebox/core/constant.hpp"

namespace {

namespace constant = codebox::core::constant;

using codebox::ErrorKind;
using codebox::ExecutionOutcome;
using codebox::Json;

using Clock = std::chrono::steady_clock;

// Code with an explicit `return` runs as a function body; anything else goes
// through global indirect eval, whose completion value is the last expression.
constexpr std::string_view HARNESS =
    "(function (source, hasReturn) { return hasReturn ? Function(source)() : (0, eval)(source); })";

struct RuntimeDeleter {
  void operator()(JSRuntime* runtime) const noexcept {
    JS_FreeRuntime(runtime);
  }
};

struct ContextDeleter {
  void operator()(JSContext* context) const noexcept {
    JS_FreeContext(context);
  }
};

using RuntimePtr = std::unique_ptr<JSRuntime, RuntimeDeleter>;
using ContextPtr = std::unique_ptr<JSContext, ContextDeleter>;

// Owns one JSValue for the lifetime of the scope.
class ScopedValue {
  JSContext* context_;
  JSValue    value_;

public:
  ScopedValue(JSContext* context, JSValue value)
      : context_(context), value_(value) {}

  ~ScopedValue() {
    JS_FreeValue(context_, value_);
  }

  ScopedValue(ScopedValue const&)            = delete;
  ScopedValue& operator=(ScopedValue const&) = delete;

  [[nodiscard]] auto get() const noexcept -> JSValue {
    return value_;
  }

  [[nodiscard]] auto is_exception() const noexcept -> bool {
    return JS_IsException(value_);
  }
};

auto to_std_string(JSContext* context, JSValueConst value) -> std::string {
  size_t      length = 0;
  char const* text   = JS_ToCStringLen(context, &length, value);
  if (text == nullptr) {
    return {};
  }
  std::string result{text, length};
  JS_FreeCString(context, text);
  return result;
}

auto interrupt_on_deadline(JSRuntime*, void* opaque) -> int {
  auto const* deadline = static_cast<Clock::time_point const*>(opaque);
  return Clock::now() >= *deadline ? 1 : 0;
}

enum ConsoleLevel : int { Log, Info, Warn, Error, Debug };

auto console_write(JSContext* context, JSValueConst, int argc, JSValueConst* argv, int level) -> JSValue {
  std::string line;
  for (int i = 0; i < argc; ++i) {
    if (i > 0) {
      line += ' ';
    }
    line += to_std_string(context, argv[i]);
  }

  switch (level) {
    case Warn:
      spdlog::warn("[js] {}", line);
      break;
    case Error:
      spdlog::error("[js] {}", line);
      break;
    case Debug:
      spdlog::debug("[js] {}", line);
      break;
    default:
      spdlog::info("[js] {}", line);
      break;
  }
  return JS_UNDEFINED;
}

void install_console(JSContext* context, JSValueConst global) {
  JSValue console = JS_NewObject(context);

  constexpr std::pair<char const*, int> methods[] = {
      {"log",   Log  },
      {"info",  Info },
      {"warn",  Warn },
      {"error", Error},
      {"debug", Debug},
  };
  for (auto const& [name, level] : methods) {
    JS_SetPropertyStr(
        context, console, name, JS_NewCFunctionMagic(context, console_write, name, 1, JS_CFUNC_generic_magic, level)
    );
  }

  JS_SetPropertyStr(context, global, "console", console);
}

// Describes the pending exception, distinguishing the deadline from user errors.
auto take_exception(JSContext* context, Clock::time_point deadline, std::chrono::milliseconds budget)
    -> std::string {
  ScopedValue exception{context, JS_GetException(context)};

  if (Clock::now() >= deadline) {
    return fmt::format("Execution timed out after {}ms", budget.count());
  }

  auto message = to_std_string(context, exception.get());
  if (JS_IsObject(exception.get())) {
    ScopedValue stack{context, JS_GetPropertyStr(context, exception.get(), "stack")};
    if (JS_IsString(stack.get())) {
      spdlog::debug("JavaScript error stack:\n{}", to_std_string(context, stack.get()));
    }
  }
  return message.empty() ? std::string{"JavaScript execution failed"} : message;
}

auto result_to_json(JSContext* context, JSValueConst value, Json const& fallback) -> codebox::core::Result<Json> {
  if (JS_IsUndefined(value)) {
    return fallback;
  }

  ScopedValue serialized{context, JS_JSONStringify(context, value, JS_UNDEFINED, JS_UNDEFINED)};
  if (serialized.is_exception()) {
    ScopedValue exception{context, JS_GetException(context)};
    return std::unexpected(to_std_string(context, exception.get()));
  }
  // Functions and symbols have no JSON form
  if (JS_IsUndefined(serialized.get())) {
    return fallback;
  }

  auto parsed = Json::parse(to_std_string(context, serialized.get()), nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected(std::string{"Result could not be converted to JSON"});
  }
  return parsed;
}

} // namespace

namespace codebox {

InterpreterAdapter::InterpreterAdapter(std::chrono::milliseconds deadline)
    : deadline_(clamp_timeout(deadline)) {}

auto InterpreterAdapter::run(ExecutionRequest const& request) const -> ExecutionOutcome {
  RuntimePtr runtime{JS_NewRuntime()};
  if (!runtime) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, "Failed to create JavaScript runtime");
  }
  JS_SetMemoryLimit(runtime.get(), constant::INTERPRETER_MEMORY_LIMIT);
  JS_SetMaxStackSize(runtime.get(), constant::INTERPRETER_STACK_LIMIT);

  ContextPtr context_owner{JS_NewContext(runtime.get())};
  if (!context_owner) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, "Failed to create JavaScript context");
  }
  JSContext* context = context_owner.get();

  auto deadline = Clock::now() + deadline_;
  JS_SetInterruptHandler(runtime.get(), interrupt_on_deadline, &deadline);

  {
    ScopedValue global{context, JS_GetGlobalObject(context)};
    install_console(context, global.get());

    auto    input_text = request.input_.dump();
    JSValue input      = JS_ParseJSON(context, input_text.c_str(), input_text.size(), "<input>");
    if (JS_IsException(input)) {
      return ExecutionOutcome::fail(ErrorKind::RuntimeFault, take_exception(context, deadline, deadline_));
    }
    JS_SetPropertyStr(context, global.get(), "input", input);
  }

  ScopedValue harness{context, JS_Eval(context, HARNESS.data(), HARNESS.size(), "<harness>", JS_EVAL_TYPE_GLOBAL)};
  if (harness.is_exception()) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, take_exception(context, deadline, deadline_));
  }

  static std::regex const return_statement{R"(\breturn\b)"};
  bool const              has_return = std::regex_search(request.code_, return_statement);

  ScopedValue source{context, JS_NewStringLen(context, request.code_.data(), request.code_.size())};
  JSValue     args[] = {source.get(), JS_NewBool(context, has_return)};

  spdlog::debug("Evaluating {} byte(s) of JavaScript (function body: {})", request.code_.size(), has_return);

  ScopedValue result{context, JS_Call(context, harness.get(), JS_UNDEFINED, 2, args)};
  if (result.is_exception()) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, take_exception(context, deadline, deadline_));
  }

  auto value = result_to_json(context, result.get(), request.input_);
  if (!value) {
    return ExecutionOutcome::fail(ErrorKind::RuntimeFault, value.error());
  }
  return ExecutionOutcome::ok(std::move(*value));
}

} // namespace codebox
