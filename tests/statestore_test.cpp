#include "log.hpp"
#include "statestore.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

class FileStateStoreTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path file;

    void SetUp() override {
        Log::SetConsoleOutput(false);
        dir = fs::temp_directory_path() / "arcboost_tests" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(dir);
        file = dir / "ArcBooster" / "applied_tweaks.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void Write(const std::string& content) {
        fs::create_directories(file.parent_path());
        std::ofstream stream(file, std::ios::binary);
        stream << content;
    }

    std::string Read() {
        std::ifstream stream(file, std::ios::binary);
        std::stringstream ss;
        ss << stream.rdbuf();
        return ss.str();
    }
};

TEST_F(FileStateStoreTest, AbsentFileIsEmptyRecord) {
    FileStateStore store(file);

    auto record = store.Load();

    EXPECT_TRUE(record.Empty());
    EXPECT_TRUE(record.Extras().empty());
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(FileStateStoreTest, SaveCreatesDirectoryAndLeavesNoTemporary) {
    FileStateStore store(file);
    AppliedRecord record;
    record.Put("game_mode_enable", AppliedEntry { .prior_state = 0, .applied_at = "2025-01-01T00:00:00Z" });

    store.Save(record);

    ASSERT_TRUE(fs::exists(file));
    EXPECT_FALSE(fs::exists(fs::path(file.string() + ".tmp")));

    auto loaded = store.Load();
    ASSERT_EQ(loaded.Size(), 1u);
    EXPECT_EQ(loaded.Find("game_mode_enable")->prior_state, 0);
    EXPECT_EQ(loaded.Find("game_mode_enable")->applied_at, "2025-01-01T00:00:00Z");
}

TEST_F(FileStateStoreTest, LoadThenSaveIsByteIdentical) {
    const std::string content = R"({
    "power_plan_high": {
        "priorState": "381b4222-f694-41f0-9685-ff5bb260df2e",
        "appliedAt": "2025-03-01T10:00:00Z"
    },
    "applied": [
        "game_mode"
    ],
    "disable_game_bar": {
        "priorState": {
            "HKCU\\Software\\Microsoft\\Windows\\CurrentVersion\\GameDVR\\AppCaptureEnabled": 1,
            "HKCU\\System\\GameConfigStore\\GameDVR_Enabled": null
        },
        "appliedAt": "2025-03-01T10:00:01Z"
    }
})";
    Write(content);
    FileStateStore store(file);

    store.Save(store.Load());

    EXPECT_EQ(Read(), content);
}

TEST_F(FileStateStoreTest, UnknownEntryFieldsSurviveSave) {
    const std::string content = R"({
    "game_mode_enable": {
        "version": 2,
        "priorState": 0,
        "appliedAt": "2025-03-01T10:00:00Z",
        "note": "x"
    }
})";
    Write(content);
    FileStateStore store(file);

    store.Save(store.Load());
    EXPECT_EQ(Read(), content);

    // Re-applying replaces only the captured value and the timestamp
    auto record = store.Load();
    record.Put("game_mode_enable", AppliedEntry { .prior_state = 1, .applied_at = "2025-04-01T00:00:00Z" });
    store.Save(record);

    auto j = json::parse(Read());
    EXPECT_EQ(j["game_mode_enable"]["version"], 2);
    EXPECT_EQ(j["game_mode_enable"]["note"], "x");
    EXPECT_EQ(j["game_mode_enable"]["priorState"], 1);
    EXPECT_EQ(j["game_mode_enable"]["appliedAt"], "2025-04-01T00:00:00Z");
}

TEST_F(FileStateStoreTest, UnreachablePathIsCorruption) {
    // A path component longer than any filesystem allows cannot be queried
    FileStateStore store(dir / std::string(300, 'a') / "applied_tweaks.json");

    EXPECT_THROW(store.Load(), StateCorruptedException);
}

TEST_F(FileStateStoreTest, LegacyRecordIsKeptAsExtras) {
    Write(R"({"applied": ["game_mode", "visual_fx"], "last_modified": "2024-12-31"})");
    FileStateStore store(file);

    auto record = store.Load();
    EXPECT_TRUE(record.Empty());
    EXPECT_TRUE(record.Extras().contains("applied"));
    EXPECT_TRUE(record.Extras().contains("last_modified"));

    record.Put("game_mode_enable", AppliedEntry { .prior_state = nullptr, .applied_at = "2025-01-01T00:00:00Z" });
    store.Save(record);

    auto j = json::parse(Read());
    EXPECT_EQ(j["applied"], json::array({ "game_mode", "visual_fx" }));
    EXPECT_EQ(j["last_modified"], "2024-12-31");
    EXPECT_TRUE(j["game_mode_enable"]["priorState"].is_null());
}

TEST_F(FileStateStoreTest, InvalidJsonIsCorruption) {
    Write("{ \"power_plan_high\": { \"priorState\": ");
    FileStateStore store(file);

    EXPECT_THROW(store.Load(), StateCorruptedException);
    // The unreadable file must survive untouched
    EXPECT_EQ(Read(), "{ \"power_plan_high\": { \"priorState\": ");
}

TEST_F(FileStateStoreTest, NonObjectIsCorruption) {
    Write("[1, 2, 3]");
    FileStateStore store(file);

    EXPECT_THROW(store.Load(), StateCorruptedException);
}

TEST(AppliedRecordTest, PutKeepsInsertionOrderAndReplacesInPlace) {
    AppliedRecord record;
    record.Put("b", AppliedEntry { .prior_state = 1, .applied_at = "t1" });
    record.Put("a", AppliedEntry { .prior_state = 2, .applied_at = "t2" });
    record.Put("b", AppliedEntry { .prior_state = 3, .applied_at = "t3" });

    ASSERT_EQ(record.Size(), 2u);
    EXPECT_EQ(record.Entries()[0].first, "b");
    EXPECT_EQ(record.Entries()[0].second.prior_state, 3);
    EXPECT_EQ(record.Entries()[1].first, "a");

    EXPECT_TRUE(record.Remove("b"));
    EXPECT_FALSE(record.Remove("b"));
    EXPECT_EQ(record.ToJson().dump(), R"({"a":{"priorState":2,"appliedAt":"t2"}})");
}

TEST(AppliedRecordTest, EntryWithoutTimestampIsAnExtra) {
    auto record = AppliedRecord::FromJson(json { { "x", { { "priorState", 1 } } } });

    EXPECT_TRUE(record.Empty());
    EXPECT_TRUE(record.Extras().contains("x"));
}
