#include <array>
#include <chrono>
#include <fstream>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "codebox/cli/app.hpp"
#include "codebox/core/constant.hpp"
#include "test_utils.hpp"

namespace codebox::cli::test {

using namespace std::chrono_literals;

class AppTest : public ::testing::Test {
protected:
  template<size_t N>
  auto parse(std::array<char const*, N> argv) -> Arguments {
    auto args = parser_.parse(static_cast<int>(argv.size()), argv.data());
    EXPECT_TRUE(args.has_value()) << args.error();
    return args.value_or(Arguments{});
  }

  ArgumentParser          parser_ = create_default_arg_parser();
  SandboxConfig           config_;
  codebox::test::ScratchDir scratch_;
};

TEST_F(AppTest, RequestFromFlags) {
  auto args    = parse(std::array<char const*, 9>{"codebox", "-l", "js", "-c", "input.a", "-i", R"({"a": 1})", "-t", "250"});
  auto request = build_request(args, config_);

  ASSERT_TRUE(request.has_value()) << request.error();
  EXPECT_EQ(request->language_, "js");
  EXPECT_EQ(request->code_, "input.a");
  EXPECT_EQ(request->input_["a"], 1);
  EXPECT_EQ(request->timeout_, 250ms);
}

TEST_F(AppTest, TimeoutFlagIsCapped) {
  auto args    = parse(std::array<char const*, 5>{"codebox", "-c", "1", "-t", "10000000000000"});
  auto request = build_request(args, config_);

  ASSERT_TRUE(request.has_value()) << request.error();
  EXPECT_EQ(request->timeout_, core::constant::MAX_EXECUTION_TIMEOUT);
}

TEST_F(AppTest, DefaultsToPythonAndConfiguredTimeout) {
  config_.default_timeout_ = 4321ms;

  auto args    = parse(std::array<char const*, 5>{"codebox", "-c", "result = 1", "-p", "numpy, pandas"});
  auto request = build_request(args, config_);

  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->language_, "python");
  EXPECT_EQ(request->timeout_, 4321ms);
  EXPECT_EQ(request->packages_, (std::set<std::string>{"numpy", "pandas"}));
}

TEST_F(AppTest, RequestFromFileWithFlagOverride) {
  auto path = scratch_.path() / "request.json";
  std::ofstream{path} << R"({"language": "bash", "code": "echo 1", "timeoutMs": 900})";

  auto args    = parse(std::array<char const*, 5>{"codebox", "-r", path.c_str(), "-c", "echo 2"});
  auto request = build_request(args, config_);

  ASSERT_TRUE(request.has_value()) << request.error();
  EXPECT_EQ(request->language_, "bash");
  EXPECT_EQ(request->code_, "echo 2");
  EXPECT_EQ(request->timeout_, 900ms);
}

TEST_F(AppTest, CodeFromFile) {
  auto path = scratch_.path() / "main.py";
  std::ofstream{path} << "result = 42\n";

  auto args    = parse(std::array<char const*, 3>{"codebox", "-f", path.c_str()});
  auto request = build_request(args, config_);

  ASSERT_TRUE(request.has_value()) << request.error();
  EXPECT_EQ(request->code_, "result = 42\n");
}

TEST_F(AppTest, UsageErrors) {
  auto bad_input = parse(std::array<char const*, 5>{"codebox", "-c", "1", "-i", "[1]"});
  EXPECT_FALSE(build_request(bad_input, config_).has_value());

  auto bad_json = parse(std::array<char const*, 5>{"codebox", "-c", "1", "-i", "{"});
  EXPECT_FALSE(build_request(bad_json, config_).has_value());

  auto bad_timeout = parse(std::array<char const*, 5>{"codebox", "-c", "1", "-t", "soon"});
  EXPECT_FALSE(build_request(bad_timeout, config_).has_value());

  auto both = parse(std::array<char const*, 5>{"codebox", "-c", "1", "-f", "x.py"});
  EXPECT_FALSE(build_request(both, config_).has_value());

  auto missing_file = parse(std::array<char const*, 3>{"codebox", "-r", "/nonexistent/request.json"});
  EXPECT_FALSE(build_request(missing_file, config_).has_value());
}

TEST_F(AppTest, Overrides) {
  auto args = parse(std::array<char const*, 5>{"codebox", "--service-url", " http://svc ", "--allow", "numpy"});
  apply_overrides(args, config_);

  EXPECT_EQ(config_.service_url_, "http://svc");
  EXPECT_TRUE(config_.policy_.is_permitted("numpy"));
  EXPECT_FALSE(config_.policy_.is_permitted("pandas"));
  EXPECT_TRUE(config_.policy_.is_denied("os"));
}

TEST_F(AppTest, ExitStatus) {
  auto help = std::array<char const*, 2>{"codebox", "--help"};
  EXPECT_EQ(run_app(static_cast<int>(help.size()), help.data()), 0);

  auto unknown = std::array<char const*, 2>{"codebox", "--frobnicate"};
  EXPECT_EQ(run_app(static_cast<int>(unknown.size()), unknown.data()), 2);

  auto missing_code = std::array<char const*, 3>{"codebox", "-l", "python"};
  EXPECT_EQ(run_app(static_cast<int>(missing_code.size()), missing_code.data()), 1);
}

} // namespace codebox::cli::test
