#include "fakes.hpp"
#include "log.hpp"
#include "tweak.hpp"

#include <gtest/gtest.h>

namespace {
    Tweaks::Setting Dword(const char* path, const char* name, std::uint32_t value) {
        return Tweaks::Setting { .key = SettingKey { .path = path, .name = name }, .value = value };
    }

    Tweak Base(const char* id) {
        return Tweak { .id = id, .name = id };
    }
}

class TweakBuilderTest : public ::testing::Test {
protected:
    FakeExecutor executor;

    void SetUp() override {
        Log::SetConsoleOutput(false);
    }
};

TEST_F(TweakBuilderTest, SettingCapturesBareValue) {
    executor.settings[FakeExecutor::Key("HKCU\\A", "V")] = std::string("old");
    auto tweak = Tweaks::SettingTweak(Base("t"), Tweaks::Setting {
        .key = SettingKey { .path = "HKCU\\A", .name = "V" },
        .value = std::string("new")
    });

    auto prior = tweak.apply(executor);
    EXPECT_EQ(prior, "old");
    EXPECT_EQ(executor.Get("HKCU\\A", "V"), SettingValue(std::string("new")));

    tweak.undo(executor, prior);
    EXPECT_EQ(executor.Get("HKCU\\A", "V"), SettingValue(std::string("old")));
}

TEST_F(TweakBuilderTest, AbsentValueIsDeletedOnUndo) {
    auto tweak = Tweaks::SettingTweak(Base("t"), Dword("HKCU\\A", "V", 1));

    auto prior = tweak.apply(executor);
    EXPECT_TRUE(prior.is_null());

    tweak.undo(executor, prior);
    EXPECT_FALSE(executor.Get("HKCU\\A", "V").has_value());
    EXPECT_EQ(executor.log.back(), "delete HKCU\\A\\V");
}

TEST_F(TweakBuilderTest, FailedMultiWriteRollsBack) {
    executor.settings[FakeExecutor::Key("HKCU\\A", "One")] = std::uint32_t(10);
    executor.failing_keys.insert(FakeExecutor::Key("HKCU\\A", "Three"));
    auto tweak = Tweaks::SettingsTweak(Base("t"), {
        Dword("HKCU\\A", "One", 1),
        Dword("HKCU\\A", "Two", 2),
        Dword("HKCU\\A", "Three", 3)
    });

    EXPECT_THROW(tweak.apply(executor), ExecutorException);

    EXPECT_EQ(executor.Get("HKCU\\A", "One"), SettingValue(std::uint32_t(10)));
    EXPECT_FALSE(executor.Get("HKCU\\A", "Two").has_value());
    EXPECT_FALSE(executor.Get("HKCU\\A", "Three").has_value());
}

TEST_F(TweakBuilderTest, MultiSettingPriorIsKeyedByFullPath) {
    executor.settings[FakeExecutor::Key("HKCU\\A", "One")] = std::uint32_t(10);
    auto tweak = Tweaks::SettingsTweak(Base("t"), { Dword("HKCU\\A", "One", 1), Dword("HKCU\\B", "Two", 2) });

    auto prior = tweak.apply(executor);

    EXPECT_EQ(prior, (PriorState { { "HKCU\\A\\One", 10 }, { "HKCU\\B\\Two", nullptr } }));
}

TEST_F(TweakBuilderTest, UndoContinuesPastFailureAndReportsIt) {
    auto tweak = Tweaks::SettingsTweak(Base("t"), { Dword("HKCU\\A", "One", 1), Dword("HKCU\\A", "Two", 2) });
    auto prior = tweak.apply(executor);

    executor.failing_keys.insert(FakeExecutor::Key("HKCU\\A", "Two"));
    EXPECT_THROW(tweak.undo(executor, prior), ExecutorException);
    EXPECT_FALSE(executor.Get("HKCU\\A", "One").has_value());
}

TEST_F(TweakBuilderTest, PerSubkeyWritesEveryInterface) {
    executor.subkeys["HKLM\\Ifaces"] = { "a", "b" };
    auto tweak = Tweaks::PerSubkeySettingsTweak(Base("t"), "HKLM\\Ifaces", { { "NoDelay", SettingValue(std::uint32_t(1)) } });

    auto prior = tweak.apply(executor);

    EXPECT_EQ(prior.size(), 2u);
    EXPECT_EQ(executor.Get("HKLM\\Ifaces\\a", "NoDelay"), SettingValue(std::uint32_t(1)));
    EXPECT_EQ(executor.Get("HKLM\\Ifaces\\b", "NoDelay"), SettingValue(std::uint32_t(1)));

    tweak.undo(executor, prior);
    EXPECT_TRUE(executor.settings.empty());
}

TEST_F(TweakBuilderTest, ServiceIsStoppedAndRestarted) {
    executor.service_modes["Svc"] = ServiceMode::Manual;
    executor.running_services.insert("Svc");
    auto tweak = Tweaks::ServiceTweak(Base("t"), "Svc", ServiceMode::Disabled);

    auto prior = tweak.apply(executor);
    EXPECT_EQ(prior.at("mode"), "Manual");
    EXPECT_EQ(prior.at("running"), true);
    EXPECT_EQ(executor.service_modes["Svc"], ServiceMode::Disabled);
    EXPECT_FALSE(executor.running_services.contains("Svc"));

    tweak.undo(executor, prior);
    EXPECT_EQ(executor.service_modes["Svc"], ServiceMode::Manual);
    EXPECT_TRUE(executor.running_services.contains("Svc"));
}

TEST_F(TweakBuilderTest, MissingServiceFailsWithoutChanges) {
    auto tweak = Tweaks::ServiceTweak(Base("t"), "Svc", ServiceMode::Disabled);

    EXPECT_THROW(tweak.apply(executor), ExecutorException);
    EXPECT_TRUE(executor.log.empty());
}

TEST_F(TweakBuilderTest, CacheFailuresAreAggregated) {
    executor.failing_caches = { "x", "y" };
    auto tweak = Tweaks::CacheTweak(Base("t"), { "x", "y", "z" });

    try {
        tweak.apply(executor);
        FAIL() << "Expected ExecutorException";
    } catch (const ExecutorException& ex) {
        EXPECT_NE(ex.message.find("and 1 more"), std::string::npos);
    }
    EXPECT_EQ(executor.log, (std::vector<std::string> { "clear z" }));
}

TEST_F(TweakBuilderTest, CapturedValueOutOfRangeIsRejected) {
    EXPECT_THROW(Tweaks::SettingValueFromJson(PriorState(-1)), ExecutorException);
    EXPECT_THROW(Tweaks::SettingValueFromJson(PriorState(4294967296LL)), ExecutorException);
    EXPECT_EQ(Tweaks::SettingValueFromJson(PriorState(4294967295LL)), SettingValue(std::uint32_t(0xFFFFFFFF)));
}
