#include "leaderboard/leaderboard_reconciler.hpp"
#include "utils/metrics.hpp"

#include <spdlog/spdlog.h>
#include <set>
#include <stdexcept>

namespace thisthat {

namespace {

// Clears the in-flight flag on every exit path
class InFlightReset {
public:
    explicit InFlightReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightReset() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

} // namespace

LeaderboardReconciler::LeaderboardReconciler(std::shared_ptr<Database> db,
                                             std::shared_ptr<RankedStore> store,
                                             LeaderboardKeys keys)
    : db_(std::move(db))
    , store_(std::move(store))
    , keys_(std::move(keys))
{
    if (!db_ || !store_) {
        throw std::invalid_argument("LeaderboardReconciler requires a database and ranked store");
    }
}

SyncResult LeaderboardReconciler::sync_leaderboard_to_db() {
    SyncResult result;

    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        spdlog::debug("Leaderboard sync already in flight, skipping");
        return result;
    }
    InFlightReset reset(in_flight_);
    result.ran = true;

    auto pnl = store_->members_descending(keys_.pnl);
    auto volume = store_->members_descending(keys_.volume);

    if (pnl.empty() && volume.empty()) {
        spdlog::info("Leaderboard sync: no ranked users, nothing to do");
        return result;
    }

    std::set<std::string> missing;
    TransactionGuard guard(*db_);

    for (size_t i = 0; i < pnl.size(); ++i) {
        if (db_->set_rank_by_pnl(pnl[i].member, static_cast<int64_t>(i + 1))) {
            result.pnl_ranked++;
        } else {
            missing.insert(pnl[i].member);
        }
    }

    for (size_t i = 0; i < volume.size(); ++i) {
        if (db_->set_rank_by_volume(volume[i].member, static_cast<int64_t>(i + 1))) {
            result.volume_ranked++;
        } else {
            missing.insert(volume[i].member);
        }
    }

    guard.commit();
    result.missing_users = static_cast<int>(missing.size());

    if (!missing.empty()) {
        spdlog::warn("Leaderboard sync ignored {} ranked members with no user record", missing.size());
    }
    spdlog::info("Synced {} PnL and {} volume rankings to DB", result.pnl_ranked, result.volume_ranked);
    METRIC_COUNTER("leaderboard_syncs").increment();
    return result;
}

size_t LeaderboardReconciler::warm_cache_from_db() {
    auto users = db_->list_users();
    for (const auto& user : users) {
        store_->set_score(keys_.pnl, user.id, user.overall_pnl);
        store_->set_score(keys_.volume, user.id, user.total_volume);
    }
    spdlog::info("Initialized leaderboard cache with {} users", users.size());
    return users.size();
}

} // namespace thisthat
