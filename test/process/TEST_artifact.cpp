#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "codebox/process/artifact.hpp"
#include "test_utils.hpp"

namespace codebox::process::test {

namespace fs = std::filesystem;

class ArtifactTest : public ::testing::Test {
protected:
  codebox::test::ScratchDir scratch_;
};

TEST_F(ArtifactTest, ExecutionIdsAreUniqueHex) {
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    auto id = generate_execution_id();
    EXPECT_EQ(id.size(), 32U);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos) << id;
    ids.insert(std::move(id));
  }
  EXPECT_EQ(ids.size(), 100U);
}

TEST_F(ArtifactTest, CreatesPrivateDirectoryAndRemovesIt) {
  fs::path directory;
  {
    auto artifact = ExecutionArtifact::create(scratch_.path(), "main.py");
    ASSERT_TRUE(artifact.has_value()) << artifact.error();

    directory = artifact->work_directory();
    EXPECT_TRUE(fs::is_directory(directory));
    EXPECT_EQ(directory.parent_path(), scratch_.path());
    EXPECT_EQ(directory.filename().string(), "codebox-" + artifact->execution_id());
    EXPECT_EQ(fs::status(directory).permissions() & fs::perms::all, fs::perms::owner_all);
    EXPECT_EQ(artifact->script_path(), directory / "main.py");

    ASSERT_TRUE(artifact->write_script("print('hi')\n").has_value());
    ASSERT_TRUE(artifact->write_manifest("numpy\n").has_value());
    ASSERT_TRUE(artifact->manifest_path().has_value());
    EXPECT_EQ(artifact->manifest_path()->filename(), "requirements.txt");

    std::ifstream script{artifact->script_path()};
    std::string   line;
    std::getline(script, line);
    EXPECT_EQ(line, "print('hi')");
  }
  EXPECT_FALSE(fs::exists(directory));
  EXPECT_EQ(scratch_.entry_count(), 0U);
}

TEST_F(ArtifactTest, MovedFromArtifactDoesNotRemove) {
  auto created = ExecutionArtifact::create(scratch_.path(), "main.sh");
  ASSERT_TRUE(created.has_value());

  auto directory = created->work_directory();
  {
    ExecutionArtifact moved{std::move(*created)};
    EXPECT_TRUE(created->work_directory().empty()); // NOLINT(bugprone-use-after-move)
    EXPECT_TRUE(fs::exists(directory));
  }
  EXPECT_FALSE(fs::exists(directory));
}

TEST_F(ArtifactTest, MissingTempRootFails) {
  auto artifact = ExecutionArtifact::create(scratch_.path() / "does" / "not" / "exist", "main.py");
  EXPECT_FALSE(artifact.has_value());
}

} // namespace codebox::process::test
