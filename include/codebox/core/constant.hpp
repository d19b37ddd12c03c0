#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace codebox::core::constant {

constexpr std::string_view EXE_NAME = "codebox";
constexpr std::string_view EXE_DESC = "Polyglot code execution sandbox";
constexpr std::string_view VERSION  = "v0.1.0";

// Environment variables read by the configuration layer
constexpr std::string_view ALLOWED_PACKAGES_VAR   = "PYTHON_ALLOWED_PACKAGES";
constexpr std::string_view SERVICE_URL_VAR        = "PYTHON_SERVICE_URL";
constexpr std::string_view DENYLIST_VAR           = "CODEBOX_DENYLIST";
constexpr std::string_view PYTHON_BINARY_VAR      = "CODEBOX_PYTHON";
constexpr std::string_view PIP_BINARY_VAR         = "CODEBOX_PIP";
constexpr std::string_view SHELL_BINARY_VAR       = "CODEBOX_SHELL";
constexpr std::string_view TMPDIR_VAR             = "CODEBOX_TMPDIR";
constexpr std::string_view JS_TIMEOUT_VAR         = "CODEBOX_JS_TIMEOUT_MS";
constexpr std::string_view INSTALL_TIMEOUT_VAR    = "CODEBOX_INSTALL_TIMEOUT_MS";
constexpr std::string_view DEFAULT_TIMEOUT_VAR    = "CODEBOX_DEFAULT_TIMEOUT_MS";
constexpr std::string_view LOG_LEVEL_VAR          = "CODEBOX_LOG_LEVEL";

// Default binaries
constexpr std::string_view DEFAULT_PYTHON_BINARY = "python3";
constexpr std::string_view DEFAULT_PIP_BINARY    = "pip3";
constexpr std::string_view DEFAULT_SHELL_BINARY  = "bash";

// Timing constants
constexpr std::chrono::milliseconds DEFAULT_EXECUTION_TIMEOUT{30000};
constexpr std::chrono::milliseconds MAX_EXECUTION_TIMEOUT{24LL * 60 * 60 * 1000}; // 24h
constexpr std::chrono::milliseconds INTERPRETER_TIMEOUT{5000};
constexpr std::chrono::milliseconds INSTALL_TIMEOUT{10000};
constexpr std::chrono::milliseconds REMOTE_TIMEOUT_BUFFER{5000};
constexpr std::chrono::milliseconds SIGTERM_GRACE_PERIOD{500};
constexpr std::chrono::milliseconds EXIT_POLL_INTERVAL{50};

// Process management constants
constexpr int    SIGNAL_EXIT_CODE_OFFSET  = 128;
constexpr size_t DEFAULT_PIPE_BUFFER_SIZE = 8192;
constexpr size_t MAX_CAPTURED_OUTPUT      = 10UL * 1024 * 1024; // 10MB per stream

// Interpreter limits
constexpr size_t INTERPRETER_MEMORY_LIMIT = 64UL * 1024 * 1024; // 64MB
constexpr size_t INTERPRETER_STACK_LIMIT  = 1024UL * 1024;      // 1MB

// Artifact naming
constexpr std::string_view ARTIFACT_DIR_PREFIX = "codebox-";
constexpr std::string_view MANIFEST_FILE_NAME  = "requirements.txt";

// Structured error marker written by the wrapper scripts
constexpr std::string_view ERROR_MARKER = "__error__";

} // namespace codebox::core::constant
