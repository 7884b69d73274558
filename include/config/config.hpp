#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/decimal.hpp"

namespace thisthat {

struct DatabaseConfig {
    std::string path{"./data/thisthat.db"};
    int busy_timeout_ms{5000};               // SQLite waits this long for the write lock
};

struct BettingConfig {
    Credits min_bet{Credits::from_micros(10'000'000)};          // 10 credits
    Credits max_bet{Credits::from_micros(10'000'000'000)};      // 10,000 credits
    int max_pending_bets_per_user{200};
    Credits max_stake_per_market{Credits::from_micros(50'000'000'000)};  // per user
    int market_lookup_timeout_ms{2000};
    int max_pending_lookups{16};             // Lookup workers alive at once, hung ones included
    int hold_ttl_seconds{300};
    int duplicate_wait_ms{5000};             // Wait for an in-flight request with the same key
    int max_retries{2};                      // Retries after the first attempt
    int retry_initial_delay_ms{500};         // Doubled on every retry
};

struct SkipConfig {
    int ttl_hours{72};
    int cleanup_interval_seconds{3600};
};

struct LeaderboardConfig {
    int sync_interval_seconds{300};
    std::string pnl_key{"leaderboard:live:pnl"};
    std::string volume_key{"leaderboard:live:volume"};
};

struct ResolutionConfig {
    int poll_interval_seconds{60};
};

struct EconomyConfig {
    Credits signup_bonus{Credits::from_micros(1'000'000'000)};  // 1,000 credits
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    DatabaseConfig database;
    BettingConfig betting;
    SkipConfig skip;
    LeaderboardConfig leaderboard;
    ResolutionConfig resolution;
    EconomyConfig economy;
    LoggingConfig logging;

    // Optional JSON array of markets loaded into the directory at startup
    std::string market_feed_path;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Apply THISTHAT_* environment overrides
    void apply_env_overrides();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Decimal& d);
void from_json(const nlohmann::json& j, Decimal& d);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace thisthat
