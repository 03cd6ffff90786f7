#include "executor.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ClearDirectoryTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        Log::SetConsoleOutput(false);
        dir = fs::temp_directory_path() / "arcboost_tests" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void Touch(const fs::path& path) {
        fs::create_directories(path.parent_path());
        std::ofstream stream(path);
        stream << "cache";
    }
};

TEST_F(ClearDirectoryTest, RemovesContentsAndKeepsDirectory) {
    fs::path cache = dir / "D3DSCache";
    Touch(cache / "a.bin");
    Touch(cache / "nested" / "b.bin");

    ClearDirectory(cache);

    EXPECT_TRUE(fs::is_directory(cache));
    EXPECT_TRUE(fs::is_empty(cache));
}

TEST_F(ClearDirectoryTest, MissingDirectoryIsNotAnError) {
    EXPECT_NO_THROW(ClearDirectory(dir / "NVIDIA" / "DXCache"));
}

TEST_F(ClearDirectoryTest, FileInsteadOfDirectoryThrowsExecutorException) {
    Touch(dir / "GLCache");

    EXPECT_THROW(ClearDirectory(dir / "GLCache"), ExecutorException);
    EXPECT_TRUE(fs::exists(dir / "GLCache"));
}

TEST_F(ClearDirectoryTest, UnreachablePathThrowsExecutorException) {
    EXPECT_THROW(ClearDirectory(dir / std::string(300, 'a')), ExecutorException);
}
