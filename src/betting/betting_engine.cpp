#include "betting/betting_engine.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace thisthat {

std::shared_ptr<MarketGate> make_market_gate(std::shared_ptr<MarketSource> source,
                                             const BettingConfig& config) {
    return std::make_shared<MarketGate>(std::move(source),
                                        std::chrono::milliseconds(config.market_lookup_timeout_ms),
                                        config.max_pending_lookups);
}

BettingEngine::BettingEngine(std::shared_ptr<Ledger> ledger,
                             std::shared_ptr<MarketGate> markets,
                             std::shared_ptr<PricingModel> pricing,
                             BettingConfig config,
                             ClockFn clock)
    : ledger_(std::move(ledger))
    , markets_(std::move(markets))
    , pricing_(std::move(pricing))
    , config_(config)
    , clock_(clock ? std::move(clock) : system_clock_fn())
{
    if (!ledger_ || !markets_ || !pricing_) {
        throw std::invalid_argument("BettingEngine requires ledger, market gate and pricing model");
    }
    retry_.max_retries = config_.max_retries;
    retry_.initial_delay = std::chrono::milliseconds(config_.retry_initial_delay_ms);
}

// ============================================================================
// VALIDATION
// ============================================================================

Side BettingEngine::validate_side(const std::string& side) const {
    auto parsed = side_from_string(side);
    if (!parsed) {
        throw ValidationError("side must be 'this' or 'that', got '" + side + "'");
    }
    return *parsed;
}

void BettingEngine::validate_amount(Credits amount) const {
    if (amount < config_.min_bet || amount > config_.max_bet) {
        throw ValidationError(fmt::format("amount {} outside [{}, {}]",
                                          amount.to_string(),
                                          config_.min_bet.to_string(),
                                          config_.max_bet.to_string()));
    }
}

// ============================================================================
// PLACE BET
// ============================================================================

PlaceBetResult BettingEngine::place_bet(const PlaceBetRequest& request) {
    ScopedLatency latency(METRIC_HISTOGRAM("place_bet_latency"));

    if (request.user_id.empty() || request.market_id.empty()) {
        throw ValidationError("user_id and market_id are required");
    }
    Side side = validate_side(request.side);
    validate_amount(request.amount);
    if (request.idempotency_key && request.idempotency_key->empty()) {
        throw ValidationError("idempotency_key must not be empty when present");
    }

    // Reserve the stake first; fails fast with InsufficientFunds or NotFound.
    // A keyed request waits out an earlier request with the same key that is
    // still between its hold and its commit.
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.duplicate_wait_ms);
    Reservation reservation = reserve_stake(request);
    while (!reservation.hold && !reservation.existing) {
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Bet request {} for {} still in flight after {}ms",
                         *request.idempotency_key, request.user_id, config_.duplicate_wait_ms);
            throw ServiceUnavailable("Request " + *request.idempotency_key + " is still in progress");
        }
        std::this_thread::sleep_for(kInFlightPollInterval);
        reservation = reserve_stake(request);
    }

    if (reservation.existing) {
        spdlog::info("Duplicate bet request {} for {} -> bet {}",
                     *request.idempotency_key, request.user_id, reservation.existing->id);
        METRIC_COUNTER("bets_duplicate").increment();
        return PlaceBetResult{*reservation.existing, ledger_->get_balance(request.user_id).balance, true};
    }
    HoldRecord hold = *reservation.hold;

    PlaceBetResult result;
    try {
        MarketRecord market = markets_->require_open(request.market_id, clock_());
        Quote quote = pricing_->quote_entry(market, side, request.amount);

        result = retry_with_backoff("place_bet", retry_, [&]() {
            return commit_bet(request, market, side, quote, hold);
        });
    } catch (...) {
        release_hold_after_failure(hold.id);
        throw;
    }

    if (result.duplicate) {
        release_hold_after_failure(hold.id);
        METRIC_COUNTER("bets_duplicate").increment();
        return result;
    }

    after_commit(result.bet);

    spdlog::info("Bet {} placed: user={} market={} side={} amount={} shares={} price={}",
                 result.bet.id, result.bet.user_id, result.bet.market_id,
                 to_string(result.bet.side), result.bet.amount.to_string(),
                 result.bet.shares.to_string(), result.bet.price_at_bet.to_string());
    METRIC_COUNTER("bets_placed").increment();
    return result;
}

BettingEngine::Reservation BettingEngine::reserve_stake(const PlaceBetRequest& request) {
    Database& db = ledger_->database();
    TransactionGuard guard(db);
    Reservation reservation;

    if (request.idempotency_key) {
        reservation.existing = db.find_bet_by_idempotency_key(request.user_id, *request.idempotency_key);
        if (reservation.existing ||
            db.find_active_hold(request.user_id, kBetHoldReason, *request.idempotency_key, clock_())) {
            guard.commit();
            return reservation;
        }
    }

    reservation.hold = ledger_->place_hold(request.user_id, request.amount, kBetHoldReason,
                                           request.idempotency_key.value_or(""),
                                           std::chrono::seconds(config_.hold_ttl_seconds));
    guard.commit();
    return reservation;
}

PlaceBetResult BettingEngine::commit_bet(const PlaceBetRequest& request,
                                         const MarketRecord& market,
                                         Side side, const Quote& quote,
                                         const HoldRecord& hold) {
    Database& db = ledger_->database();
    TransactionGuard guard(db);
    int64_t now = clock_();

    if (request.idempotency_key) {
        auto existing = db.find_bet_by_idempotency_key(request.user_id, *request.idempotency_key);
        if (existing) {
            guard.commit();
            return PlaceBetResult{*existing, ledger_->get_balance(request.user_id).balance, true};
        }
    }

    if (db.count_pending_bets_for_user(request.user_id) >= config_.max_pending_bets_per_user) {
        throw ValidationError(fmt::format("user {} already has {} pending bets",
                                          request.user_id, config_.max_pending_bets_per_user));
    }
    Credits staked = db.pending_stake_for_market(request.user_id, market.id);
    if (staked + request.amount > config_.max_stake_per_market) {
        throw ValidationError(fmt::format("stake on market {} would exceed {}",
                                          market.id, config_.max_stake_per_market.to_string()));
    }

    BetRecord bet;
    bet.id = generate_uuid();
    bet.user_id = request.user_id;
    bet.market_id = market.id;
    bet.side = side;
    bet.amount = request.amount;
    bet.shares = quote.shares;
    bet.price_at_bet = quote.price;
    bet.potential_payout = quote.potential_payout;
    bet.idempotency_key = request.idempotency_key;
    bet.status = BetStatus::PENDING;
    bet.created_at = now;

    db.insert_bet(bet);
    CreditTransaction debit = ledger_->capture_hold(hold.id, TransactionType::BET, bet.id);
    db.add_user_stats(request.user_id, Credits(), request.amount);

    guard.commit();
    return PlaceBetResult{bet, debit.balance_after, false};
}

void BettingEngine::release_hold_after_failure(const std::string& hold_id) {
    try {
        ledger_->release_hold(hold_id);
    } catch (const std::exception& e) {
        // The hold still lapses at its expiry
        spdlog::error("Failed to release hold {}: {}", hold_id, e.what());
    }
}

void BettingEngine::after_commit(const BetRecord& bet) {
    if (tracker_) {
        try {
            tracker_->remove_skip(bet.user_id, bet.market_id);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to clear skip for {} on {}: {}", bet.user_id, bet.market_id, e.what());
        }
    }

    publish_scores(bet.user_id, std::nullopt);
}

void BettingEngine::publish_scores(const std::string& user_id, std::optional<UserRecord> user) {
    if (!publisher_) return;
    try {
        if (!user) {
            user = ledger_->database().get_user(user_id);
        }
        if (user) {
            publisher_->publish(*user);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to refresh leaderboard scores for {}: {}", user_id, e.what());
    }
}

// ============================================================================
// SELL POSITION
// ============================================================================

SellResult BettingEngine::sell_position(const std::string& user_id, const std::string& bet_id) {
    Database& db = ledger_->database();

    auto bet = db.get_bet(bet_id);
    if (!bet || bet->user_id != user_id) {
        throw NotFound("Bet not found: " + bet_id);
    }
    if (bet->status != BetStatus::PENDING) {
        throw ValidationError(fmt::format("Bet {} is {}, only pending bets can be sold",
                                          bet_id, to_string(bet->status)));
    }

    auto market = markets_->lookup(bet->market_id);
    if (!market) {
        throw MarketNotOpen("Unknown market: " + bet->market_id);
    }
    if (market->resolution || market->status == MarketStatus::RESOLVED ||
        market->status == MarketStatus::INVALID) {
        throw MarketNotOpen("Market " + market->id + " is already resolved");
    }

    Credits credits_received = pricing_->exit_value(*bet, *market);
    Credits profit = credits_received - bet->amount;

    std::optional<UserRecord> updated_user;
    SellResult result = retry_with_backoff("sell_position", retry_, [&]() {
        TransactionGuard guard(db);
        int64_t now = clock_();

        if (!db.settle_bet(bet->id, BetStatus::CANCELLED, credits_received, now)) {
            throw ValidationError("Bet " + bet->id + " is no longer pending");
        }

        Credits balance = db.get_user(user_id)->credit_balance;
        if (credits_received.is_positive()) {
            balance = ledger_->credit(user_id, credits_received,
                                      TransactionType::POSITION_SOLD, bet->id).balance_after;
        }
        db.add_user_stats(user_id, profit, Credits());
        if (profit.is_positive()) {
            db.raise_biggest_win(user_id, profit);
        }
        updated_user = db.get_user(user_id);
        guard.commit();

        SellResult r;
        r.bet = *bet;
        r.bet.status = BetStatus::CANCELLED;
        r.bet.actual_payout = credits_received;
        r.bet.resolved_at = now;
        r.credits_received = credits_received;
        r.profit = profit;
        r.new_balance = balance;
        return r;
    });

    // The sale is committed; nothing below may fail it
    publish_scores(user_id, updated_user);

    spdlog::info("Position {} sold by {}: received {} (profit {})",
                 bet_id, user_id, credits_received.to_string(), profit.to_string());
    METRIC_COUNTER("positions_sold").increment();
    return result;
}

// ============================================================================
// QUERIES
// ============================================================================

Quote BettingEngine::quote(const std::string& market_id, const std::string& side, Credits amount) {
    Side parsed = validate_side(side);
    validate_amount(amount);
    MarketRecord market = markets_->require_open(market_id, clock_());
    return pricing_->quote_entry(market, parsed, amount);
}

std::optional<BetRecord> BettingEngine::get_bet(const std::string& bet_id) {
    return ledger_->database().get_bet(bet_id);
}

std::vector<BetRecord> BettingEngine::list_bets(const std::string& user_id,
                                                std::optional<BetStatus> status,
                                                int limit, int offset) {
    if (limit < 0 || offset < 0) {
        throw ValidationError("limit and offset must not be negative");
    }
    return ledger_->database().list_bets_for_user(user_id, status,
                                                  std::min(limit, kMaxPageSize), offset);
}

} // namespace thisthat
