#include <gtest/gtest.h>
#include "config/config.hpp"
#include "persistence/database.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace thisthat;

class ConfigTest : public ::testing::Test {
protected:
    std::string config_path_;

    void SetUp() override {
        config_path_ = "/tmp/test_config_" + generate_uuid() + ".json";
        unsetenv("THISTHAT_DB_PATH");
        unsetenv("THISTHAT_LOG_LEVEL");
    }

    void TearDown() override {
        std::filesystem::remove(config_path_);
        unsetenv("THISTHAT_DB_PATH");
        unsetenv("THISTHAT_LOG_LEVEL");
    }

    void write(const std::string& text) {
        std::ofstream out(config_path_);
        out << text;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.economy.signup_bonus, Credits::from_whole(1000));
    EXPECT_EQ(config.skip.ttl_hours, 72);
    EXPECT_EQ(config.betting.min_bet, Credits::from_whole(10));
    EXPECT_EQ(config.betting.max_pending_lookups, 16);
    EXPECT_EQ(config.betting.duplicate_wait_ms, 5000);
}

TEST_F(ConfigTest, SaveAndLoadPreservesValues) {
    Config config;
    config.database.path = "/tmp/somewhere.db";
    config.betting.max_bet = Credits::parse("2500.5");
    config.leaderboard.sync_interval_seconds = 30;
    config.market_feed_path = "markets.json";
    config.save(config_path_);

    Config loaded = Config::load(config_path_);
    EXPECT_EQ(loaded.database.path, "/tmp/somewhere.db");
    EXPECT_EQ(loaded.betting.max_bet, Credits::parse("2500.5"));
    EXPECT_EQ(loaded.leaderboard.sync_interval_seconds, 30);
    EXPECT_EQ(loaded.market_feed_path, "markets.json");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write(R"({"betting": {"min_bet": 5, "max_bet": 100.25}})");

    Config loaded = Config::load(config_path_);
    EXPECT_EQ(loaded.betting.min_bet, Credits::from_whole(5));
    EXPECT_EQ(loaded.betting.max_bet, Credits::parse("100.25"));
    EXPECT_EQ(loaded.skip.ttl_hours, 72);
}

TEST_F(ConfigTest, InvalidValuesRejected) {
    write(R"({"betting": {"min_bet": "50", "max_bet": "10"}})");
    EXPECT_THROW(Config::load(config_path_), std::runtime_error);

    write(R"({"leaderboard": {"pnl_key": "same", "volume_key": "same"}})");
    EXPECT_THROW(Config::load(config_path_), std::runtime_error);

    write(R"({"betting": {"max_pending_lookups": 0}})");
    EXPECT_THROW(Config::load(config_path_), std::runtime_error);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load("/tmp/does_not_exist_" + generate_uuid() + ".json"),
                 std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    write(R"({"database": {"path": "from_file.db"}})");
    setenv("THISTHAT_DB_PATH", "/tmp/from_env.db", 1);
    setenv("THISTHAT_LOG_LEVEL", "debug", 1);

    Config loaded = Config::load(config_path_);
    EXPECT_EQ(loaded.database.path, "/tmp/from_env.db");
    EXPECT_EQ(loaded.logging.log_level, "debug");
}
