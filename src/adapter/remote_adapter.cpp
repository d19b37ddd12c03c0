#include "codebox/adapter/remote_adapter.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <curl/curl.h>

namespace {

using codebox::ErrorKind;
using codebox::ExecutionOutcome;
using codebox::Json;

struct CurlDeleter {
  void operator()(CURL* handle) const noexcept {
    curl_easy_cleanup(handle);
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const noexcept {
    curl_slist_free_all(list);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

// curl_global_init is not thread-safe and must run once per process.
auto ensure_curl_initialized() -> CURLcode {
  static std::once_flag flag;
  static CURLcode       result = CURLE_OK;
  std::call_once(flag, [] { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  return result;
}

auto collect_body(char* data, size_t size, size_t count, void* user) -> size_t {
  auto* body = static_cast<std::string*>(user);
  body->append(data, size * count);
  return size * count;
}

auto request_body(codebox::ExecutionRequest const& request) -> std::string {
  Json body;
  body["code"]     = request.code_;
  body["input"]    = request.input_;
  body["packages"] = Json::array();
  for (auto const& package : request.packages_) {
    body["packages"].push_back(package);
  }
  body["timeoutMs"] = request.timeout_.count();
  return body.dump();
}

} // namespace

namespace codebox {

RemoteAdapter::RemoteAdapter(std::string endpoint, std::chrono::milliseconds timeout_buffer)
    : endpoint_(std::move(endpoint)), timeout_buffer_(timeout_buffer) {
  while (!endpoint_.empty() && endpoint_.back() == '/') {
    endpoint_.pop_back();
  }
}

auto RemoteAdapter::endpoint() const noexcept -> std::string const& {
  return endpoint_;
}

auto RemoteAdapter::execute_url() const -> std::string {
  return endpoint_ + "/execute";
}

auto RemoteAdapter::run(ExecutionRequest const& request) const -> ExecutionOutcome {
  if (auto rc = ensure_curl_initialized(); rc != CURLE_OK) {
    return ExecutionOutcome::fail(
        ErrorKind::ServiceUnavailable, fmt::format("HTTP client initialization failed: {}", curl_easy_strerror(rc))
    );
  }

  CurlHandle handle{curl_easy_init()};
  if (!handle) {
    return ExecutionOutcome::fail(ErrorKind::ServiceUnavailable, "HTTP client initialization failed");
  }

  HeaderList headers{curl_slist_append(nullptr, "Content-Type: application/json")};
  if (!headers) {
    return ExecutionOutcome::fail(ErrorKind::ServiceUnavailable, "HTTP client initialization failed");
  }

  auto        url     = execute_url();
  auto        payload = request_body(request);
  std::string response;
  auto        client_timeout = clamp_timeout(request.timeout_) + timeout_buffer_;

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(client_timeout.count()));
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, collect_body);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);

  spdlog::debug("POST {} ({} byte(s), client timeout {}ms)", url, payload.size(), client_timeout.count());

  if (auto rc = curl_easy_perform(handle.get()); rc != CURLE_OK) {
    spdlog::debug("Execution service request failed: {}", curl_easy_strerror(rc));
    return ExecutionOutcome::fail(
        ErrorKind::ServiceUnavailable, fmt::format("Execution service unreachable: {}", curl_easy_strerror(rc))
    );
  }

  long status = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);

  return interpret_service_response(status, response);
}

auto interpret_service_response(long status, std::string const& body) -> ExecutionOutcome {
  auto parsed = Json::parse(body, nullptr, false);

  if (status >= 200 && status < 300) {
    if (parsed.is_discarded()) {
      return ExecutionOutcome::ok(Json(body));
    }
    if (parsed.is_object() && parsed.contains("result")) {
      return ExecutionOutcome::ok(parsed["result"]);
    }
    return ExecutionOutcome::ok(std::move(parsed));
  }

  if (parsed.is_discarded()) {
    std::optional<Json> details;
    if (!body.empty()) {
      details = Json(body);
    }
    return ExecutionOutcome::fail(ErrorKind::ServiceUnavailable, fmt::format("HTTP {}", status), std::move(details));
  }

  std::string message = fmt::format("HTTP {}", status);
  if (parsed.is_object()) {
    if (auto it = parsed.find("error"); it != parsed.end() && it->is_string()) {
      message = it->get<std::string>();
    }
  }
  return ExecutionOutcome::fail(ErrorKind::ServiceUnavailable, std::move(message), std::move(parsed));
}

} // namespace codebox
