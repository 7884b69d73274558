#include "settlement/resolution_watcher.hpp"
#include "utils/metrics.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace thisthat {

ResolutionWatcher::ResolutionWatcher(std::shared_ptr<ResolutionSource> source,
                                     std::shared_ptr<PositionSettlement> settlement)
    : source_(std::move(source))
    , settlement_(std::move(settlement))
{
    if (!source_ || !settlement_) {
        throw std::invalid_argument("ResolutionWatcher requires a source and settlement");
    }
}

WatcherCycle ResolutionWatcher::run_once() {
    WatcherCycle cycle;
    std::set<std::string> reported;

    for (const auto& event : source_->poll_resolved()) {
        reported.insert(event.market_id);
        if (completed_.count(event.market_id)) {
            continue;
        }
        cycle.markets_seen++;

        try {
            auto result = settlement_->settle_positions_for_market(event.market_id, event.resolution);
            cycle.bets_settled += result.settled;
            cycle.errors += result.errors;
            if (result.errors == 0) {
                completed_.insert(event.market_id);
                cycle.markets_settled++;
            }
        } catch (const std::exception& e) {
            cycle.errors++;
            spdlog::error("Settlement of market {} failed: {}", event.market_id, e.what());
        }
    }

    // Forget markets the source has stopped reporting
    for (auto it = completed_.begin(); it != completed_.end();) {
        if (reported.count(*it)) {
            ++it;
        } else {
            it = completed_.erase(it);
        }
    }

    METRIC_COUNTER("markets_settled").increment(cycle.markets_settled);

    if (cycle.markets_seen > 0) {
        spdlog::info("Resolution watcher: {} markets seen, {} settled, {} bets, {} errors",
                     cycle.markets_seen, cycle.markets_settled, cycle.bets_settled, cycle.errors);
    }
    return cycle;
}

} // namespace thisthat
