#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"
#include "leaderboard/ranked_store.hpp"
#include "ledger/ledger.hpp"
#include "market/pricing.hpp"

#include <memory>
#include <string>

namespace thisthat {

struct SettlementResult {
    std::string market_id;
    Resolution resolution{Resolution::INVALID};
    int settled{0};
    int won{0};
    int lost{0};
    int cancelled{0};
    int errors{0};
    Credits total_payout;           // payouts plus refunds
    bool already_settled{false};    // nothing was pending
};

/**
 * PositionSettlement - Converts a market outcome into ledger credits.
 *
 * DESIGN:
 * - Each pending bet settles in its own IMMEDIATE transaction. The status
 *   flip is conditional on the bet still being pending, so a bet settled by
 *   a concurrent run is skipped rather than paid twice.
 * - A failure on one bet is logged and counted; the batch continues and a
 *   later run picks up whatever is still pending.
 * - invalid refunds the stake and cancels; a matching side is paid
 *   PricingModel::settlement_payout; anything else is lost.
 */
class PositionSettlement {
public:
    PositionSettlement(std::shared_ptr<Ledger> ledger,
                       std::shared_ptr<PricingModel> pricing,
                       ClockFn clock = system_clock_fn());

    void set_score_publisher(std::shared_ptr<ScorePublisher> publisher) { publisher_ = std::move(publisher); }

    SettlementResult settle_positions_for_market(const std::string& market_id,
                                                 Resolution resolution);

private:
    enum class Outcome { WON, LOST, CANCELLED, SKIPPED };

    std::shared_ptr<Ledger> ledger_;
    std::shared_ptr<PricingModel> pricing_;
    std::shared_ptr<ScorePublisher> publisher_;
    ClockFn clock_;

    Outcome settle_bet(const BetRecord& bet, Resolution resolution, Credits& credited);
};

} // namespace thisthat
