#include <chrono>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "codebox/adapter/interpreter_adapter.hpp"

namespace codebox::test {

using namespace std::chrono_literals;

class InterpreterAdapterTest : public ::testing::Test {
protected:
  auto run(std::string code, Json input = Json::object()) -> ExecutionOutcome {
    ExecutionRequest request;
    request.language_ = "javascript";
    request.code_     = std::move(code);
    request.input_    = std::move(input);
    return adapter_.run(request);
  }

  InterpreterAdapter adapter_{500ms};
};

TEST_F(InterpreterAdapterTest, LastExpressionIsTheResult) {
  auto outcome = run("const xs = [1, 2, 3]; xs.reduce((a, b) => a + b, 0)");

  ASSERT_TRUE(outcome.success_) << outcome.error_->message_;
  ASSERT_NE(outcome.value(), nullptr);
  EXPECT_EQ(*outcome.value(), 6);
}

TEST_F(InterpreterAdapterTest, ExplicitReturn) {
  auto outcome = run("const total = input.a + input.b;\nreturn { total };", Json{{"a", 2}, {"b", 3}});

  ASSERT_TRUE(outcome.success_) << outcome.error_->message_;
  EXPECT_EQ((*outcome.value())["total"], 5);
}

TEST_F(InterpreterAdapterTest, UndefinedResultPassesInputThrough) {
  auto input   = Json{{"keep", "me"}};
  auto outcome = run("let unused = 1;", input);

  ASSERT_TRUE(outcome.success_);
  EXPECT_EQ(*outcome.value(), input);
}

TEST_F(InterpreterAdapterTest, StringsAndNestedValues) {
  auto outcome = run("({ greeting: 'hi ' + input.name, list: [1, null, true] })", Json{{"name", "ada"}});

  ASSERT_TRUE(outcome.success_);
  EXPECT_EQ(outcome.value()->dump(), R"({"greeting":"hi ada","list":[1,null,true]})");
}

TEST_F(InterpreterAdapterTest, ConsoleIsAvailable) {
  auto outcome = run("console.log('side', 'effect'); console.error('oops'); 'done'");

  ASSERT_TRUE(outcome.success_);
  EXPECT_EQ(*outcome.value(), "done");
}

TEST_F(InterpreterAdapterTest, ThrownErrorIsRuntimeFault) {
  auto outcome = run("throw new Error('boom')");

  ASSERT_FALSE(outcome.success_);
  EXPECT_EQ(outcome.error_kind(), ErrorKind::RuntimeFault);
  EXPECT_NE(outcome.error_->message_.find("boom"), std::string::npos);
}

TEST_F(InterpreterAdapterTest, SyntaxErrorIsRuntimeFault) {
  auto outcome = run("let = ;");
  ASSERT_FALSE(outcome.success_);
  EXPECT_EQ(outcome.error_kind(), ErrorKind::RuntimeFault);
}

TEST_F(InterpreterAdapterTest, InfiniteLoopHitsDeadline) {
  auto start   = std::chrono::steady_clock::now();
  auto outcome = run("while (true) {}");
  auto took    = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(outcome.success_);
  EXPECT_EQ(outcome.error_kind(), ErrorKind::RuntimeFault);
  EXPECT_NE(outcome.error_->message_.find("timed out"), std::string::npos);
  EXPECT_LT(took, 3s);
}

TEST_F(InterpreterAdapterTest, NoHostCapabilities) {
  auto outcome = run("[typeof require, typeof process, typeof std, typeof os]");

  ASSERT_TRUE(outcome.success_);
  EXPECT_EQ(outcome.value()->dump(), R"(["undefined","undefined","undefined","undefined"])");
}

TEST_F(InterpreterAdapterTest, GlobalsDoNotLeakBetweenCalls) {
  ASSERT_TRUE(run("globalThis.leaked = 41; 1").success_);

  auto outcome = run("typeof leaked");
  ASSERT_TRUE(outcome.success_);
  EXPECT_EQ(*outcome.value(), "undefined");
}

} // namespace codebox::test
