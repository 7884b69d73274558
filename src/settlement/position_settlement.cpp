#include "settlement/position_settlement.hpp"
#include "utils/metrics.hpp"

#include <spdlog/spdlog.h>
#include <set>
#include <stdexcept>

namespace thisthat {

PositionSettlement::PositionSettlement(std::shared_ptr<Ledger> ledger,
                                       std::shared_ptr<PricingModel> pricing,
                                       ClockFn clock)
    : ledger_(std::move(ledger))
    , pricing_(std::move(pricing))
    , clock_(clock ? std::move(clock) : system_clock_fn())
{
    if (!ledger_ || !pricing_) {
        throw std::invalid_argument("PositionSettlement requires ledger and pricing model");
    }
}

SettlementResult PositionSettlement::settle_positions_for_market(const std::string& market_id,
                                                                 Resolution resolution) {
    SettlementResult result;
    result.market_id = market_id;
    result.resolution = resolution;

    Database& db = ledger_->database();
    auto pending = db.get_pending_bets_for_market(market_id);
    if (pending.empty()) {
        result.already_settled = true;
        spdlog::info("Market {} has no pending bets, nothing to settle", market_id);
        return result;
    }

    spdlog::info("Settling {} pending bets on market {} as {}",
                 pending.size(), market_id, to_string(resolution));

    std::set<std::string> touched_users;
    for (const auto& bet : pending) {
        try {
            Credits credited;
            Outcome outcome = settle_bet(bet, resolution, credited);
            if (outcome == Outcome::SKIPPED) {
                continue;
            }

            result.settled++;
            result.total_payout += credited;
            touched_users.insert(bet.user_id);
            switch (outcome) {
                case Outcome::WON: result.won++; break;
                case Outcome::LOST: result.lost++; break;
                case Outcome::CANCELLED: result.cancelled++; break;
                case Outcome::SKIPPED: break;
            }
        } catch (const std::exception& e) {
            result.errors++;
            spdlog::error("Failed to settle bet {} on market {}: {}", bet.id, market_id, e.what());
        }
    }

    if (publisher_) {
        for (const auto& user_id : touched_users) {
            try {
                auto user = db.get_user(user_id);
                if (user) {
                    publisher_->publish(*user);
                }
            } catch (const std::exception& e) {
                spdlog::warn("Failed to refresh leaderboard scores for {}: {}", user_id, e.what());
            }
        }
    }

    METRIC_COUNTER("bets_settled").increment(result.settled);
    METRIC_COUNTER("payout_micros").increment(result.total_payout.micros());

    spdlog::info("Market {} settled: {} bets (won={} lost={} cancelled={} errors={}), paid {}",
                 market_id, result.settled, result.won, result.lost, result.cancelled,
                 result.errors, result.total_payout.to_string());
    return result;
}

PositionSettlement::Outcome PositionSettlement::settle_bet(const BetRecord& bet,
                                                           Resolution resolution,
                                                           Credits& credited) {
    Database& db = ledger_->database();
    TransactionGuard guard(db);
    int64_t now = clock_();

    Outcome outcome;
    if (resolution == Resolution::INVALID) {
        if (!db.settle_bet(bet.id, BetStatus::CANCELLED, bet.amount, now)) {
            return Outcome::SKIPPED;
        }
        ledger_->credit(bet.user_id, bet.amount, TransactionType::REFUND, bet.id);
        credited = bet.amount;
        outcome = Outcome::CANCELLED;
    } else if (side_wins(bet.side, resolution)) {
        Credits payout = pricing_->settlement_payout(bet);
        if (!db.settle_bet(bet.id, BetStatus::WON, payout, now)) {
            return Outcome::SKIPPED;
        }
        if (payout.is_positive()) {
            ledger_->credit(bet.user_id, payout, TransactionType::PAYOUT, bet.id);
        }
        Credits profit = payout - bet.amount;
        db.add_user_stats(bet.user_id, profit, Credits());
        if (profit.is_positive()) {
            db.raise_biggest_win(bet.user_id, profit);
        }
        credited = payout;
        outcome = Outcome::WON;
    } else {
        if (!db.settle_bet(bet.id, BetStatus::LOST, Credits(), now)) {
            return Outcome::SKIPPED;
        }
        db.add_user_stats(bet.user_id, -bet.amount, Credits());
        outcome = Outcome::LOST;
    }

    guard.commit();
    spdlog::debug("Bet {} -> {} (credited {})", bet.id,
                  outcome == Outcome::WON ? "won" : outcome == Outcome::LOST ? "lost" : "cancelled",
                  credited.to_string());
    return outcome;
}

} // namespace thisthat
