#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "codebox/validator.hpp"

namespace codebox::test {

class ValidatorTest : public ::testing::Test {
protected:
  auto check(std::string const& code, std::set<std::string> const& packages = {}) -> ValidationVerdict {
    return validate(code, packages, policy_, Language::Python);
  }

  void expect_rejected(std::string const& code, std::string const& symbol) {
    auto verdict = check(code);
    EXPECT_FALSE(verdict.allowed_) << code;
    EXPECT_EQ(verdict.violating_symbol_, symbol) << code;
    EXPECT_TRUE(verdict.reason_.has_value());
  }

  PolicySet policy_ = PolicySet::with_defaults();
};

TEST_F(ValidatorTest, ExtractsTopLevelModules) {
  auto modules = extract_imports("import json, os.path as p\nfrom collections.abc import Mapping\nx = 1; import re\n");
  EXPECT_EQ(modules, (std::vector<std::string>{"json", "os", "collections", "re"}));
}

TEST_F(ValidatorTest, SkipsRelativeImportsAndIdentifiersContainingImport) {
  auto modules = extract_imports("from . import sibling\nimported = 3\nfrom_value = 2\n");
  EXPECT_TRUE(modules.empty());
}

TEST_F(ValidatorTest, AcceptsPlainCode) {
  auto verdict = check("import json\nimport math\nresult = json.dumps({'x': math.sqrt(16)})\n");
  EXPECT_TRUE(verdict.allowed_);
  EXPECT_FALSE(verdict.violating_symbol_.has_value());
}

TEST_F(ValidatorTest, RejectsDeniedImports) {
  expect_rejected("import os", "os");
  expect_rejected("from os import path", "os");
  expect_rejected("import json, socket", "socket");
  expect_rejected("x = 1; import subprocess", "subprocess");

  auto verdict = check("import os");
  EXPECT_EQ(verdict.reason_, "Blocked module 'os' is not allowed for security reasons");
}

TEST_F(ValidatorTest, RejectsDangerousCalls) {
  expect_rejected("result = eval('1 + 1')", "eval");
  expect_rejected("exec('x = 1')", "exec");
  expect_rejected("m = __import__('os')", "__import__");
  expect_rejected("f = open(\"x\", \"w\")", "open");
  expect_rejected("f = open('log.txt', mode='ab')", "open");

  auto verdict = check("eval('1')");
  EXPECT_EQ(verdict.reason_, "Code contains potentially dangerous operations: eval() invocation");
}

TEST_F(ValidatorTest, AllowsLookalikes) {
  EXPECT_TRUE(check("import ast\nresult = ast.literal_eval('[1, 2]')").allowed_);
  EXPECT_TRUE(check("import re\npattern = re.compile('a+')").allowed_);
  EXPECT_TRUE(check("words = open(\"words.txt\").read()").allowed_);
  EXPECT_TRUE(check("evaluation = 3").allowed_);
}

TEST_F(ValidatorTest, OnlyTheModeArgumentDecidesWrites) {
  EXPECT_TRUE(check("data = open('a').read()").allowed_);
  EXPECT_TRUE(check("data = open(\"w\").read()").allowed_);
  EXPECT_TRUE(check("data = open('data.bin', 'rb').read()").allowed_);
  EXPECT_TRUE(check("data = open(name, encoding='utf-8').read()").allowed_);
  EXPECT_TRUE(check("reopen = opener('w')").allowed_);

  expect_rejected("with open ( path ,  \"a+\" ) as f:\n    f.write('x')", "open");
  expect_rejected("f = open(join(root, 'x'), mode = 'w')", "open");
  expect_rejected("f = open(\n  'out.txt',\n  'x',\n)", "open");
}

TEST_F(ValidatorTest, LongSourceYieldsAVerdict) {
  std::string numbers;
  for (int i = 0; i < 50000; ++i) {
    numbers += "1,";
  }
  EXPECT_TRUE(check("result = len(open([" + numbers + "]))").allowed_);
  EXPECT_TRUE(check("result = len(open([" + numbers).allowed_);

  std::string padding(100000, ' ');
  expect_rejected("result = eval" + padding + "('1')", "eval");
  expect_rejected("f = open('out.txt'," + std::string(1000, ' ') + "'w')", "open");
}

TEST_F(ValidatorTest, ChecksRequestedPackages) {
  auto verdict = check("result = 1", {"socket"});
  EXPECT_FALSE(verdict.allowed_);
  EXPECT_EQ(verdict.violating_symbol_, "socket");
  EXPECT_EQ(verdict.reason_, "Blocked package 'socket' is not allowed for security reasons");

  EXPECT_TRUE(check("result = 1", {"numpy"}).allowed_);
}

TEST_F(ValidatorTest, EnforcesAllowlist) {
  policy_ = PolicySet::with_defaults({}, {"numpy"});

  EXPECT_TRUE(check("import numpy").allowed_);

  auto verdict = check("import pandas");
  EXPECT_FALSE(verdict.allowed_);
  EXPECT_EQ(verdict.reason_, "Module 'pandas' is not in the allowed packages list");

  auto package = check("result = 1", {"scipy"});
  EXPECT_FALSE(package.allowed_);
  EXPECT_EQ(package.reason_, "Package 'scipy' is not in the allowed packages list");
}

TEST_F(ValidatorTest, ImportsAreCheckedBeforePatterns) {
  auto verdict = check("import os\neval('1')");
  EXPECT_EQ(verdict.violating_symbol_, "os");
}

TEST_F(ValidatorTest, ShellRules) {
  auto shell = [this](std::string const& code) { return validate(code, {}, policy_, Language::Shell); };

  EXPECT_TRUE(shell("echo $((1 + 2))").allowed_);
  // Python imports mean nothing to a shell script
  EXPECT_TRUE(shell("echo 'import os'").allowed_);

  auto network = shell("curl http://example.com");
  EXPECT_FALSE(network.allowed_);
  EXPECT_EQ(network.violating_symbol_, "curl");

  auto device = shell("echo hi > /dev/tcp/10.0.0.1/80");
  EXPECT_FALSE(device.allowed_);
  EXPECT_EQ(device.violating_symbol_, "/dev/tcp");

  EXPECT_FALSE(shell("ls | sudo tee /etc/x").allowed_);
  EXPECT_FALSE(shell(":(){ :|:& };:").allowed_);
}

} // namespace codebox::test
