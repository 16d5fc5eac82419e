#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "sandbox/temp_dir.hpp"

namespace sandcell::sandbox {
namespace {

namespace fs = std::filesystem;

TEST(TempDirTest, CreatesAndRemovesDirectory) {
    fs::path path;
    {
        TempDir dir("sandcell-test");
        path = dir.Path();
        ASSERT_TRUE(fs::is_directory(path));
        EXPECT_EQ(path.filename().string().rfind("sandcell-test-", 0), 0u);
        std::ofstream(path / "file.txt") << "data";
        fs::create_directories(path / "nested" / "deeper");
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(TempDirTest, SanitizesPrefix) {
    TempDir dir("../session id/x");
    EXPECT_EQ(dir.Path().parent_path(), fs::temp_directory_path());
    EXPECT_EQ(dir.Path().filename().string().find('/'), std::string::npos);
}

TEST(TempDirTest, MoveTransfersOwnership) {
    TempDir first("sandcell-move");
    const auto path = first.Path();
    TempDir second(std::move(first));
    EXPECT_TRUE(first.Path().empty());
    EXPECT_EQ(second.Path(), path);
    second.Remove();
    EXPECT_FALSE(fs::exists(path));
    second.Remove();
}

}  // namespace
}  // namespace sandcell::sandbox
