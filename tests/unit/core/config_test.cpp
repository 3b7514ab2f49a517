// Brickfall Core Tests
// config_test.cpp - Configuration system tests

#include <gtest/gtest.h>

#include <brickfall/core/config.hpp>
#include <brickfall/platform/file_io.hpp>

namespace brickfall::core {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = platform::FileSystem::get_temp_directory() / "brickfall_config_test";
        platform::FileSystem::create_directories(test_dir_);
    }

    void TearDown() override { platform::FileSystem::remove_all(test_dir_); }

    std::filesystem::path test_dir_;
    Config config;
};

TEST_F(ConfigTest, DefaultsArePresent) {
    EXPECT_DOUBLE_EQ(config.get_double(config_section::GAMEPLAY, config_key::COIN_MULTIPLIER), 1.0);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::GAMEPLAY, config_key::DROP_CHANCE_BONUS), 0.0);
    EXPECT_EQ(config.get_int(config_section::GAMEPLAY, config_key::STARTING_LIVES), 3);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::COLLISION, config_key::DEBOUNCE_WINDOW_MS), 50.0);
    EXPECT_EQ(config.get_int(config_section::COLLISION, config_key::PRUNE_THRESHOLD), 100);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::COLLISION, config_key::PRUNE_MAX_AGE_MS), 1000.0);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::EXPLOSIONS, config_key::FUSE_STEP_DELAY_MS), 100.0);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::EXPLOSIONS, config_key::TNT_FALLBACK_RADIUS), 80.0);
    EXPECT_EQ(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "info");
}

TEST_F(ConfigTest, MissingKeyReturnsDefaultArgument) {
    EXPECT_EQ(config.get_int("nope", "missing", 42), 42);
    EXPECT_EQ(config.get_string(config_section::GAMEPLAY, "missing", "fallback"), "fallback");
    EXPECT_FALSE(config.has(config_section::GAMEPLAY, "missing"));
    EXPECT_TRUE(config.has(config_section::EXPLOSIONS, config_key::FUSE_STEP_DELAY_MS));
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault) {
    config.set_string(config_section::GAMEPLAY, config_key::STARTING_LIVES, "many");
    EXPECT_EQ(config.get_int(config_section::GAMEPLAY, config_key::STARTING_LIVES, 7), 7);
    EXPECT_FALSE(config.get_bool(config_section::GAMEPLAY, config_key::COIN_MULTIPLIER, false));
}

TEST_F(ConfigTest, LoadFromStringMergesOverDefaults) {
    ASSERT_TRUE(config.load_from_string(R"({"gameplay": {"talents": "brick-breaker"}})"));

    EXPECT_EQ(config.get_string(config_section::GAMEPLAY, config_key::TALENTS), "brick-breaker");
    EXPECT_EQ(config.get_int(config_section::GAMEPLAY, config_key::STARTING_LIVES), 3);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::EXPLOSIONS, config_key::FUSE_STEP_DELAY_MS), 100.0);
}

TEST_F(ConfigTest, LoadingReplacesEarlierValues) {
    config.set_int(config_section::ENDLESS, config_key::SEED, 77);
    ASSERT_TRUE(config.load_from_string(R"({"debug": {"log_level": "trace"}})"));

    EXPECT_EQ(config.get_int(config_section::ENDLESS, config_key::SEED), 0);
    EXPECT_EQ(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "trace");
}

TEST_F(ConfigTest, MalformedJsonIsRejected) {
    config.set_int(config_section::GAMEPLAY, config_key::STARTING_LIVES, 9);
    EXPECT_FALSE(config.load_from_string("{ not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2, 3]"));
    EXPECT_EQ(config.get_int(config_section::GAMEPLAY, config_key::STARTING_LIVES), 9);
}

TEST_F(ConfigTest, OverridesParseJsonValues) {
    EXPECT_TRUE(config.apply_override("explosions.fuse_step_delay_ms=40"));
    EXPECT_TRUE(config.apply_override("debug.log_to_file=true"));
    EXPECT_TRUE(config.apply_override("gameplay.talents=brick-breaker,unbreakable-breaker"));

    EXPECT_DOUBLE_EQ(config.get_double(config_section::EXPLOSIONS, config_key::FUSE_STEP_DELAY_MS), 40.0);
    EXPECT_TRUE(config.get_bool(config_section::DEBUG, config_key::LOG_TO_FILE));
    EXPECT_EQ(config.get_string(config_section::GAMEPLAY, config_key::TALENTS), "brick-breaker,unbreakable-breaker");
}

TEST_F(ConfigTest, MalformedOverridesAreIgnored) {
    EXPECT_FALSE(config.apply_override("seed=4"));
    EXPECT_FALSE(config.apply_override(".seed=4"));
    EXPECT_FALSE(config.apply_override("endless.=4"));
    EXPECT_FALSE(config.apply_override("endless.seed"));
    EXPECT_EQ(config.get_int(config_section::ENDLESS, config_key::SEED), 0);
}

TEST_F(ConfigTest, ResetRestoresDefaults) {
    config.set_double(config_section::GAMEPLAY, config_key::COIN_MULTIPLIER, 2.5);
    config.set_int("custom", "value", 1);
    config.reset_to_defaults();

    EXPECT_DOUBLE_EQ(config.get_double(config_section::GAMEPLAY, config_key::COIN_MULTIPLIER), 1.0);
    EXPECT_FALSE(config.has("custom", "value"));
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    const auto path = test_dir_ / "nested" / "settings.json";
    config.set_int(config_section::ENDLESS, config_key::SEED, 1234);
    config.set_bool(config_section::DEBUG, config_key::LOG_TO_FILE, true);
    ASSERT_TRUE(config.save(path));
    EXPECT_TRUE(platform::FileSystem::exists(path));

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.get_int(config_section::ENDLESS, config_key::SEED), 1234);
    EXPECT_TRUE(loaded.get_bool(config_section::DEBUG, config_key::LOG_TO_FILE));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(config.load(test_dir_ / "missing.json"));
}

}  // namespace
}  // namespace brickfall::core
