#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "interaction/interaction_tracker.hpp"
#include "leaderboard/ranked_store.hpp"
#include "ledger/ledger.hpp"
#include "market/market_directory.hpp"
#include "market/pricing.hpp"
#include "utils/retry.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thisthat {

struct PlaceBetRequest {
    std::string user_id;
    std::string market_id;      // internal id or external correlation id
    std::string side;           // "this" | "that"
    Credits amount;
    std::optional<std::string> idempotency_key;
};

struct PlaceBetResult {
    BetRecord bet;
    Credits new_balance;
    bool duplicate{false};      // an earlier request with the same key won
};

struct SellResult {
    BetRecord bet;
    Credits credits_received;
    Credits profit;
    Credits new_balance;
};

// Gate over source using the configured lookup timeout and worker cap.
std::shared_ptr<MarketGate> make_market_gate(std::shared_ptr<MarketSource> source,
                                             const BettingConfig& config);

/**
 * BettingEngine - Places and exits binary positions against the ledger.
 *
 * DESIGN:
 * - Validation (side, amount range, key shape) happens before any state
 *   is touched.
 * - place_bet reserves the stake with a ledger hold while the market is
 *   looked up, so a slow market source cannot let two requests spend the
 *   same credits. The hold is captured (debited) and the bet row inserted
 *   in one IMMEDIATE transaction; any failure rolls both back and the hold
 *   is released.
 * - Idempotency keys are scoped per user. The key is checked together with
 *   placing the hold, and again inside the write transaction; a unique index
 *   backs both checks. The hold carries the key, so a retry that arrives
 *   while the first request is still in flight waits for it (up to
 *   duplicate_wait_ms) and returns its bet.
 * - Busy-store failures of the write transaction are retried with
 *   exponential backoff.
 * - Skip removal and leaderboard publication run after commit and never
 *   fail the bet or the sale.
 */
class BettingEngine {
public:
    BettingEngine(std::shared_ptr<Ledger> ledger,
                  std::shared_ptr<MarketGate> markets,
                  std::shared_ptr<PricingModel> pricing,
                  BettingConfig config = {},
                  ClockFn clock = system_clock_fn());

    // Optional collaborators
    void set_score_publisher(std::shared_ptr<ScorePublisher> publisher) { publisher_ = std::move(publisher); }
    void set_interaction_tracker(std::shared_ptr<InteractionTracker> tracker) { tracker_ = std::move(tracker); }
    void set_retry_sleep(std::function<void(std::chrono::milliseconds)> sleep) { retry_.sleep = std::move(sleep); }

    PlaceBetResult place_bet(const PlaceBetRequest& request);

    SellResult sell_position(const std::string& user_id, const std::string& bet_id);

    // Prices a prospective bet without side effects.
    Quote quote(const std::string& market_id, const std::string& side, Credits amount);

    std::optional<BetRecord> get_bet(const std::string& bet_id);
    std::vector<BetRecord> list_bets(const std::string& user_id,
                                     std::optional<BetStatus> status = std::nullopt,
                                     int limit = 50, int offset = 0);

    const BettingConfig& config() const { return config_; }

private:
    std::shared_ptr<Ledger> ledger_;
    std::shared_ptr<MarketGate> markets_;
    std::shared_ptr<PricingModel> pricing_;
    std::shared_ptr<ScorePublisher> publisher_;
    std::shared_ptr<InteractionTracker> tracker_;
    BettingConfig config_;
    ClockFn clock_;
    RetryOptions retry_;

    static constexpr int kMaxPageSize = 200;
    static constexpr const char* kBetHoldReason = "bet";
    static constexpr std::chrono::milliseconds kInFlightPollInterval{10};

    // Either an earlier bet with the same key, a fresh hold, or neither when
    // a request with the same key holds its stake right now.
    struct Reservation {
        std::optional<BetRecord> existing;
        std::optional<HoldRecord> hold;
    };

    Side validate_side(const std::string& side) const;
    void validate_amount(Credits amount) const;

    Reservation reserve_stake(const PlaceBetRequest& request);
    PlaceBetResult commit_bet(const PlaceBetRequest& request, const MarketRecord& market,
                              Side side, const Quote& quote, const HoldRecord& hold);
    void release_hold_after_failure(const std::string& hold_id);
    void after_commit(const BetRecord& bet);
    // Best effort; reads the user when no post-commit snapshot is given.
    void publish_scores(const std::string& user_id, std::optional<UserRecord> user);
};

} // namespace thisthat
