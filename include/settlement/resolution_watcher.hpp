#pragma once

#include "market/market_directory.hpp"
#include "settlement/position_settlement.hpp"

#include <memory>
#include <set>
#include <string>

namespace thisthat {

struct WatcherCycle {
    int markets_seen{0};
    int markets_settled{0};
    int bets_settled{0};
    int errors{0};
};

/**
 * Polls a ResolutionSource and settles each newly resolved market.
 *
 * A market is remembered once it settles without errors; markets with
 * failures are retried on the next cycle. A remembered market is forgotten
 * once the source no longer reports it.
 */
class ResolutionWatcher {
public:
    ResolutionWatcher(std::shared_ptr<ResolutionSource> source,
                      std::shared_ptr<PositionSettlement> settlement);

    WatcherCycle run_once();

    size_t completed_markets() const { return completed_.size(); }

private:
    std::shared_ptr<ResolutionSource> source_;
    std::shared_ptr<PositionSettlement> settlement_;
    std::set<std::string> completed_;
};

} // namespace thisthat
