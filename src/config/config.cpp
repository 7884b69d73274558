#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace thisthat {

// Money is written as a decimal string so it round-trips exactly; plain
// numbers are accepted on input.
void to_json(nlohmann::json& j, const Decimal& d) {
    j = d.to_string();
}

void from_json(const nlohmann::json& j, Decimal& d) {
    if (j.is_string()) {
        d = Decimal::parse(j.get<std::string>());
    } else if (j.is_number_integer()) {
        d = Decimal::from_whole(j.get<int64_t>());
    } else {
        d = Decimal::parse(fmt::format("{:.6f}", j.get<double>()));
    }
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = nlohmann::json{
        {"path", c.path},
        {"busy_timeout_ms", c.busy_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    if (j.contains("path")) j.at("path").get_to(c.path);
    if (j.contains("busy_timeout_ms")) j.at("busy_timeout_ms").get_to(c.busy_timeout_ms);
}

void to_json(nlohmann::json& j, const BettingConfig& c) {
    j = nlohmann::json{
        {"min_bet", c.min_bet},
        {"max_bet", c.max_bet},
        {"max_pending_bets_per_user", c.max_pending_bets_per_user},
        {"max_stake_per_market", c.max_stake_per_market},
        {"market_lookup_timeout_ms", c.market_lookup_timeout_ms},
        {"max_pending_lookups", c.max_pending_lookups},
        {"hold_ttl_seconds", c.hold_ttl_seconds},
        {"duplicate_wait_ms", c.duplicate_wait_ms},
        {"max_retries", c.max_retries},
        {"retry_initial_delay_ms", c.retry_initial_delay_ms}
    };
}

void from_json(const nlohmann::json& j, BettingConfig& c) {
    if (j.contains("min_bet")) j.at("min_bet").get_to(c.min_bet);
    if (j.contains("max_bet")) j.at("max_bet").get_to(c.max_bet);
    if (j.contains("max_pending_bets_per_user")) j.at("max_pending_bets_per_user").get_to(c.max_pending_bets_per_user);
    if (j.contains("max_stake_per_market")) j.at("max_stake_per_market").get_to(c.max_stake_per_market);
    if (j.contains("market_lookup_timeout_ms")) j.at("market_lookup_timeout_ms").get_to(c.market_lookup_timeout_ms);
    if (j.contains("max_pending_lookups")) j.at("max_pending_lookups").get_to(c.max_pending_lookups);
    if (j.contains("hold_ttl_seconds")) j.at("hold_ttl_seconds").get_to(c.hold_ttl_seconds);
    if (j.contains("duplicate_wait_ms")) j.at("duplicate_wait_ms").get_to(c.duplicate_wait_ms);
    if (j.contains("max_retries")) j.at("max_retries").get_to(c.max_retries);
    if (j.contains("retry_initial_delay_ms")) j.at("retry_initial_delay_ms").get_to(c.retry_initial_delay_ms);
}

void to_json(nlohmann::json& j, const SkipConfig& c) {
    j = nlohmann::json{
        {"ttl_hours", c.ttl_hours},
        {"cleanup_interval_seconds", c.cleanup_interval_seconds}
    };
}

void from_json(const nlohmann::json& j, SkipConfig& c) {
    if (j.contains("ttl_hours")) j.at("ttl_hours").get_to(c.ttl_hours);
    if (j.contains("cleanup_interval_seconds")) j.at("cleanup_interval_seconds").get_to(c.cleanup_interval_seconds);
}

void to_json(nlohmann::json& j, const LeaderboardConfig& c) {
    j = nlohmann::json{
        {"sync_interval_seconds", c.sync_interval_seconds},
        {"pnl_key", c.pnl_key},
        {"volume_key", c.volume_key}
    };
}

void from_json(const nlohmann::json& j, LeaderboardConfig& c) {
    if (j.contains("sync_interval_seconds")) j.at("sync_interval_seconds").get_to(c.sync_interval_seconds);
    if (j.contains("pnl_key")) j.at("pnl_key").get_to(c.pnl_key);
    if (j.contains("volume_key")) j.at("volume_key").get_to(c.volume_key);
}

void to_json(nlohmann::json& j, const ResolutionConfig& c) {
    j = nlohmann::json{
        {"poll_interval_seconds", c.poll_interval_seconds}
    };
}

void from_json(const nlohmann::json& j, ResolutionConfig& c) {
    if (j.contains("poll_interval_seconds")) j.at("poll_interval_seconds").get_to(c.poll_interval_seconds);
}

void to_json(nlohmann::json& j, const EconomyConfig& c) {
    j = nlohmann::json{
        {"signup_bonus", c.signup_bonus}
    };
}

void from_json(const nlohmann::json& j, EconomyConfig& c) {
    if (j.contains("signup_bonus")) j.at("signup_bonus").get_to(c.signup_bonus);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"database", c.database},
        {"betting", c.betting},
        {"skip", c.skip},
        {"leaderboard", c.leaderboard},
        {"resolution", c.resolution},
        {"economy", c.economy},
        {"logging", c.logging},
        {"market_feed_path", c.market_feed_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("database")) j.at("database").get_to(c.database);
    if (j.contains("betting")) j.at("betting").get_to(c.betting);
    if (j.contains("skip")) j.at("skip").get_to(c.skip);
    if (j.contains("leaderboard")) j.at("leaderboard").get_to(c.leaderboard);
    if (j.contains("resolution")) j.at("resolution").get_to(c.resolution);
    if (j.contains("economy")) j.at("economy").get_to(c.economy);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("market_feed_path")) j.at("market_feed_path").get_to(c.market_feed_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);
    config.apply_env_overrides();

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (database.path.empty()) {
        spdlog::error("database.path must not be empty");
        return false;
    }

    if (database.busy_timeout_ms < 0) {
        spdlog::error("database.busy_timeout_ms must be non-negative");
        return false;
    }

    if (!betting.min_bet.is_positive() || betting.max_bet < betting.min_bet) {
        spdlog::error("betting.min_bet must be positive and <= max_bet");
        return false;
    }

    if (betting.max_pending_bets_per_user <= 0) {
        spdlog::error("betting.max_pending_bets_per_user must be positive");
        return false;
    }

    if (betting.max_stake_per_market < betting.min_bet) {
        spdlog::error("betting.max_stake_per_market must be >= min_bet");
        return false;
    }

    if (betting.market_lookup_timeout_ms <= 0 || betting.hold_ttl_seconds <= 0 ||
        betting.duplicate_wait_ms <= 0) {
        spdlog::error("betting timeouts must be positive");
        return false;
    }

    if (betting.max_pending_lookups <= 0) {
        spdlog::error("betting.max_pending_lookups must be positive");
        return false;
    }

    if (betting.max_retries < 0 || betting.retry_initial_delay_ms < 0) {
        spdlog::error("betting retry settings must be non-negative");
        return false;
    }

    if (skip.ttl_hours <= 0 || skip.cleanup_interval_seconds <= 0) {
        spdlog::error("skip.ttl_hours and skip.cleanup_interval_seconds must be positive");
        return false;
    }

    if (leaderboard.sync_interval_seconds <= 0 || resolution.poll_interval_seconds <= 0) {
        spdlog::error("job intervals must be positive");
        return false;
    }

    if (leaderboard.pnl_key.empty() || leaderboard.volume_key.empty() ||
        leaderboard.pnl_key == leaderboard.volume_key) {
        spdlog::error("leaderboard keys must be non-empty and distinct");
        return false;
    }

    if (economy.signup_bonus.is_negative()) {
        spdlog::error("economy.signup_bonus must be non-negative");
        return false;
    }

    if (logging.max_log_files <= 0 || logging.max_log_file_size_mb <= 0) {
        spdlog::error("logging file rotation settings must be positive");
        return false;
    }

    return true;
}

void Config::apply_env_overrides() {
    std::string db_path = get_env("THISTHAT_DB_PATH");
    if (!db_path.empty()) {
        database.path = db_path;
    }

    std::string log_level = get_env("THISTHAT_LOG_LEVEL");
    if (!log_level.empty()) {
        logging.log_level = log_level;
    }
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace thisthat
