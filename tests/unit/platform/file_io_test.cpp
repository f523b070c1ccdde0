// CaveGen Platform Tests
// file_io_test.cpp - Text files for configs and exported levels

#include <gtest/gtest.h>

#include "test_utils.hpp"

#include <cavegen/platform/file_io.hpp>

#include <string>

namespace cavegen::platform {
namespace {

class FileIOTest : public ::testing::Test {
protected:
    test::ScratchDirectory scratch_{"file_io"};
};

TEST_F(FileIOTest, UserDataDirectoryNamesProject) {
    EXPECT_EQ(FileSystem::get_user_data_directory().filename(), "CaveGen");
}

// Test: Exported levels land in output folders that do not exist yet
TEST_F(FileIOTest, WriteCreatesMissingParents) {
    const auto path = scratch_ / "levels" / "seed-1" / "level.json";
    ASSERT_TRUE(FileSystem::write_text(path, "{\"width\": 100}\n"));
    EXPECT_TRUE(fs::is_directory(path.parent_path()));

    const auto text = FileSystem::read_text(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "{\"width\": 100}\n");
}

// Test: Re-running generation with the same output path replaces the old level
TEST_F(FileIOTest, WriteTruncatesPreviousLevel) {
    const auto path = scratch_ / "level.json";
    ASSERT_TRUE(FileSystem::write_text(path, "{\"grid\": [[1, 1, 1], [1, 0, 1]]}"));
    ASSERT_TRUE(FileSystem::write_text(path, "{}"));
    EXPECT_EQ(FileSystem::read_text(path).value_or(""), "{}");
}

TEST_F(FileIOTest, MissingConfigReadsAsEmpty) {
    EXPECT_FALSE(FileSystem::read_text(scratch_ / "cavegen.json").has_value());
    EXPECT_FALSE(fs::exists(scratch_ / "cavegen.json"));
}

TEST_F(FileIOTest, CreateDirectoriesIsIdempotent) {
    const auto logs = scratch_ / "logs";
    EXPECT_TRUE(FileSystem::create_directories(logs));
    EXPECT_TRUE(FileSystem::create_directories(logs));
    EXPECT_TRUE(fs::is_directory(logs));
}

// Test: A file standing where a directory is needed fails without throwing
TEST_F(FileIOTest, WriteThroughFileParentFails) {
    const auto blocker = scratch_ / "blocker";
    ASSERT_TRUE(FileSystem::write_text(blocker, "x"));
    EXPECT_FALSE(FileSystem::create_directories(blocker / "sub"));
    EXPECT_FALSE(FileSystem::write_text(blocker / "sub" / "level.json", "{}"));
}

}  // namespace
}  // namespace cavegen::platform
