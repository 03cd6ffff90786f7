#include "config.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        Log::SetConsoleOutput(false);
        fs::create_directories(fs::temp_directory_path() / "arcboost_tests");
        file = fs::temp_directory_path() / "arcboost_tests" / "config.json";
        fs::remove(file);
        Config::GetInstance()->Reset();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(file, ec);
        Config::GetInstance()->Reset();
    }
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    auto config = Config::GetInstance();
    config->Load(file);

    EXPECT_FALSE(config->debug_mode);
    EXPECT_TRUE(config->log_to_file);
    EXPECT_TRUE(config->last_selection.empty());
}

TEST_F(ConfigTest, SavedValuesLoadBack) {
    auto config = Config::GetInstance();
    config->debug_mode = true;
    config->last_selection = { "disable_nagle", "power_plan_high" };
    config->Save(file);

    config->Reset();
    config->Load(file);

    EXPECT_TRUE(config->debug_mode);
    EXPECT_EQ(config->last_selection, (std::vector<std::string> { "disable_nagle", "power_plan_high" }));
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults) {
    {
        std::ofstream stream(file);
        stream << R"({"debug_mode": true, "last_selection": 5})";
    }

    auto config = Config::GetInstance();
    config->Load(file);

    EXPECT_FALSE(config->debug_mode);
    EXPECT_TRUE(config->last_selection.empty());
}
