#include <iostream>
#include <fstream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/database.hpp"
#include "ledger/ledger.hpp"
#include "market/market_directory.hpp"
#include "market/pricing.hpp"
#include "settlement/position_settlement.hpp"
#include "settlement/resolution_watcher.hpp"
#include "interaction/interaction_tracker.hpp"
#include "leaderboard/ranked_store.hpp"
#include "leaderboard/leaderboard_reconciler.hpp"
#include "jobs/periodic_job.hpp"
#include "utils/metrics.hpp"

using namespace thisthat;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/thisthat.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("thisthat", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

// Each background job owns its connection; SQLite connections are not
// shared across threads.
std::shared_ptr<Database> open_database(const DatabaseConfig& config) {
    auto db = std::make_shared<Database>(config.path, config.busy_timeout_ms);
    db->initialize_schema();
    return db;
}

int main(int argc, char* argv[]) {
    CLI::App app{"thisthat - credit ledger, settlement and leaderboard daemon"};

    std::string config_path = "configs/thisthat.json";
    std::string db_path;
    std::string metrics_path;
    bool run_once = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--db", db_path, "SQLite database path (overrides config)");
    app.add_option("--metrics-out", metrics_path, "Write metrics JSON here on shutdown");
    app.add_flag("--once", run_once, "Run every job one cycle and exit");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "thisthat v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else {
            config.apply_env_overrides();
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (!db_path.empty()) {
        config.database.path = db_path;
    }

    setup_logging(config.logging);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Starting thisthat (db={})", config.database.path);

    try {
        std::filesystem::path db_dir = std::filesystem::path(config.database.path).parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }

        auto directory = std::make_shared<MarketDirectory>();
        if (!config.market_feed_path.empty()) {
            directory->load_file(config.market_feed_path);
        }

        LeaderboardKeys keys{config.leaderboard.pnl_key, config.leaderboard.volume_key};
        auto ranked_store = std::make_shared<InMemoryRankedStore>();
        auto publisher = std::make_shared<ScorePublisher>(ranked_store, keys);
        auto pricing = std::make_shared<SharePricing>();

        // Leaderboard sync
        auto leaderboard_db = open_database(config.database);
        auto reconciler = std::make_shared<LeaderboardReconciler>(leaderboard_db, ranked_store, keys);
        reconciler->warm_cache_from_db();

        // Skip cleanup
        auto skip_db = open_database(config.database);
        auto tracker = std::make_shared<InteractionTracker>(
            skip_db, std::chrono::hours(config.skip.ttl_hours));

        // Market resolution
        auto settlement_db = open_database(config.database);
        auto ledger = std::make_shared<Ledger>(settlement_db, ledger_config_from(config));
        auto settlement = std::make_shared<PositionSettlement>(ledger, pricing);
        settlement->set_score_publisher(publisher);
        auto watcher = std::make_shared<ResolutionWatcher>(directory, settlement);

        std::vector<std::unique_ptr<PeriodicJob>> jobs;
        jobs.push_back(std::make_unique<PeriodicJob>(
            "leaderboard-sync",
            std::chrono::seconds(config.leaderboard.sync_interval_seconds),
            [reconciler] { reconciler->sync_leaderboard_to_db(); }));
        jobs.push_back(std::make_unique<PeriodicJob>(
            "skip-cleanup",
            std::chrono::seconds(config.skip.cleanup_interval_seconds),
            [tracker] { METRIC_COUNTER("skips_cleaned").increment(tracker->cleanup_expired()); }));
        jobs.push_back(std::make_unique<PeriodicJob>(
            "market-resolution",
            std::chrono::seconds(config.resolution.poll_interval_seconds),
            [watcher] { watcher->run_once(); }));

        if (run_once) {
            for (auto& job : jobs) {
                job->trigger();
            }
        } else {
            for (auto& job : jobs) {
                job->start();
            }
            while (!g_shutdown) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            spdlog::info("Shutdown signal received");
            for (auto& job : jobs) {
                job->stop();
            }
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    std::string metrics = MetricsRegistry::instance().to_json();
    if (!metrics_path.empty()) {
        std::ofstream out(metrics_path);
        out << metrics;
    }
    spdlog::info("Final metrics: {}", metrics);
    spdlog::info("thisthat stopped");
    return 0;
}
