#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "codebox/core/constant.hpp"
#include "codebox/dispatcher.hpp"
#include "test_utils.hpp"

namespace codebox::test {

using namespace std::chrono_literals;

// Records how often it ran and answers with its own name.
class RecordingAdapter final : public Adapter {
  std::string                    name_;
  mutable std::atomic<int>       calls_{0};
  mutable std::atomic<long long> last_timeout_{0};

public:
  explicit RecordingAdapter(std::string name)
      : name_(std::move(name)) {}

  auto run(ExecutionRequest const& request) const -> ExecutionOutcome override {
    ++calls_;
    last_timeout_ = request.timeout_.count();
    return ExecutionOutcome::ok(Json(name_));
  }

  [[nodiscard]] auto calls() const -> int {
    return calls_;
  }

  [[nodiscard]] auto last_timeout() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds{last_timeout_.load()};
  }
};

class ThrowingAdapter final : public Adapter {
public:
  auto run(ExecutionRequest const&) const -> ExecutionOutcome override {
    throw std::runtime_error("adapter exploded");
  }
};

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    build(true);
  }

  void build(bool with_remote) {
    auto interpreter = std::make_unique<RecordingAdapter>("interpreter");
    auto process     = std::make_unique<RecordingAdapter>("process");
    auto remote      = std::make_unique<RecordingAdapter>("remote");

    interpreter_ = interpreter.get();
    process_     = process.get();
    remote_      = with_remote ? remote.get() : nullptr;

    std::unique_ptr<Adapter> remote_adapter;
    if (with_remote) {
      remote_adapter = std::move(remote);
    }

    config_.default_timeout_ = 1234ms;
    dispatcher_ = std::make_unique<Dispatcher>(config_, std::move(interpreter), std::move(process), std::move(remote_adapter));
  }

  static auto request(std::string language, std::string code) -> ExecutionRequest {
    ExecutionRequest request;
    request.language_ = std::move(language);
    request.code_     = std::move(code);
    return request;
  }

  SandboxConfig               config_;
  std::unique_ptr<Dispatcher> dispatcher_;
  RecordingAdapter*           interpreter_ = nullptr;
  RecordingAdapter*           process_     = nullptr;
  RecordingAdapter*           remote_      = nullptr;
};

TEST_F(DispatcherTest, EmptyCodeIsMissingCode) {
  for (auto const* code : {"", "   \n\t "}) {
    auto outcome = dispatcher_->execute(request("python", code));
    EXPECT_EQ(outcome.error_kind(), ErrorKind::MissingCode);
    EXPECT_EQ(outcome.error_->message_, "Code is required");
  }
  EXPECT_EQ(process_->calls() + remote_->calls() + interpreter_->calls(), 0);
}

TEST_F(DispatcherTest, UnknownLanguage) {
  auto outcome = dispatcher_->execute(request("ruby", "puts 1"));
  EXPECT_EQ(outcome.error_kind(), ErrorKind::UnsupportedLanguage);
  EXPECT_EQ(outcome.error_->message_, "Unsupported language: ruby");
}

TEST_F(DispatcherTest, JavaScriptSkipsValidation) {
  // "eval(" would be rejected for Python
  auto outcome = dispatcher_->execute(request("js", "eval('1 + 1')"));
  ASSERT_TRUE(outcome.success_);
  EXPECT_EQ(*outcome.value(), "interpreter");
}

TEST_F(DispatcherTest, PythonPrefersRemoteWhenConfigured) {
  auto outcome = dispatcher_->execute(request("python", "result = 1"));
  EXPECT_EQ(*outcome.value(), "remote");
  EXPECT_EQ(process_->calls(), 0);

  build(false);
  outcome = dispatcher_->execute(request("python3", "result = 1"));
  EXPECT_EQ(*outcome.value(), "process");
}

TEST_F(DispatcherTest, ShellAlwaysRunsLocally) {
  auto outcome = dispatcher_->execute(request("bash", "echo 1"));
  EXPECT_EQ(*outcome.value(), "process");
  EXPECT_EQ(remote_->calls(), 0);
}

TEST_F(DispatcherTest, SecurityViolationStopsBeforeAdapters) {
  auto outcome = dispatcher_->execute(request("python", "import os\nresult = os.listdir('/')"));

  ASSERT_FALSE(outcome.success_);
  EXPECT_EQ(outcome.error_kind(), ErrorKind::SecurityViolation);
  EXPECT_EQ((*outcome.error_->details_)["symbol"], "os");
  EXPECT_EQ(remote_->calls() + process_->calls(), 0);

  auto with_package      = request("python", "result = 1");
  with_package.packages_ = {"socket"};
  EXPECT_EQ(dispatcher_->execute(with_package).error_kind(), ErrorKind::SecurityViolation);
}

TEST_F(DispatcherTest, NonPositiveTimeoutUsesDefault) {
  auto req     = request("bash", "echo 1");
  req.timeout_ = 0ms;
  ASSERT_TRUE(dispatcher_->execute(req).success_);
  EXPECT_EQ(process_->last_timeout(), 1234ms);
}

TEST_F(DispatcherTest, UnusableDefaultFallsBackToBuiltInTimeout) {
  SandboxConfig config;
  config.default_timeout_ = 0ms;

  auto  process  = std::make_unique<RecordingAdapter>("process");
  auto* recorder = process.get();
  Dispatcher dispatcher{config, std::make_unique<RecordingAdapter>("interpreter"), std::move(process), nullptr};

  auto req     = request("bash", "echo 1");
  req.timeout_ = 0ms;
  ASSERT_TRUE(dispatcher.execute(req).success_);
  EXPECT_EQ(recorder->last_timeout(), core::constant::DEFAULT_EXECUTION_TIMEOUT);
}

TEST_F(DispatcherTest, OversizedTimeoutIsCapped) {
  auto req     = request("bash", "echo 1");
  req.timeout_ = std::chrono::milliseconds{10000000000000LL};
  ASSERT_TRUE(dispatcher_->execute(req).success_);
  EXPECT_EQ(process_->last_timeout(), core::constant::MAX_EXECUTION_TIMEOUT);

  req.language_ = "js";
  ASSERT_TRUE(dispatcher_->execute(req).success_);
  EXPECT_EQ(interpreter_->last_timeout(), core::constant::MAX_EXECUTION_TIMEOUT);
}

TEST_F(DispatcherTest, ExceptionsBecomeRuntimeFault) {
  Dispatcher dispatcher{config_, std::make_unique<ThrowingAdapter>(), std::make_unique<ThrowingAdapter>(), nullptr};

  auto outcome = dispatcher.execute(request("javascript", "1"));
  ASSERT_FALSE(outcome.success_);
  EXPECT_EQ(outcome.error_kind(), ErrorKind::RuntimeFault);
  EXPECT_EQ(outcome.error_->message_, "adapter exploded");
}

TEST_F(DispatcherTest, SubmitRunsConcurrently) {
  std::vector<std::future<ExecutionOutcome>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(dispatcher_->submit(request(i % 2 == 0 ? "js" : "bash", "1")));
  }
  for (auto& future : futures) {
    EXPECT_TRUE(future.get().success_);
  }
  EXPECT_EQ(interpreter_->calls(), 4);
  EXPECT_EQ(process_->calls(), 4);
}

class DispatcherIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.temp_root_ = scratch_.path();
  }

  ScratchDir    scratch_;
  SandboxConfig config_;
};

TEST_F(DispatcherIntegrationTest, PythonEndToEnd) {
  if (!on_path("python3")) {
    GTEST_SKIP() << "python3 is not available";
  }
  Dispatcher dispatcher{config_};

  ExecutionRequest request;
  request.language_ = "python";
  request.code_     = "result = sum(input_data['numbers'])";
  request.input_    = Json{{"numbers", {1, 2, 3}}};

  auto first  = dispatcher.execute(request);
  auto second = dispatcher.execute(request);

  ASSERT_TRUE(first.success_) << first.error_->message_;
  EXPECT_EQ(to_json(first), to_json(second));
  EXPECT_EQ(to_json(first).dump(), R"({"success":true,"output":{"output":6}})");
  EXPECT_EQ(scratch_.entry_count(), 0U);
}

TEST_F(DispatcherIntegrationTest, ShellSum) {
  if (!on_path("bash")) {
    GTEST_SKIP() << "bash is not available";
  }
  Dispatcher dispatcher{config_};

  ExecutionRequest request;
  request.language_ = "bash";
  request.code_     = "echo $((2 + 3))";

  auto outcome = dispatcher.execute(request);
  ASSERT_TRUE(outcome.success_) << outcome.error_->message_;
  EXPECT_EQ(*outcome.value(), 5);
}

TEST_F(DispatcherIntegrationTest, RejectedCodeLeavesNoArtifacts) {
  Dispatcher dispatcher{config_};

  ExecutionRequest request;
  request.language_ = "python";
  request.code_     = "import subprocess";

  EXPECT_EQ(dispatcher.execute(request).error_kind(), ErrorKind::SecurityViolation);
  EXPECT_EQ(scratch_.entry_count(), 0U);
}

} // namespace codebox::test
