#pragma once

#include "leaderboard/ranked_store.hpp"
#include "persistence/database.hpp"

#include <atomic>
#include <memory>

namespace thisthat {

struct SyncResult {
    bool ran{false};            // false when another sync was already in flight
    int pnl_ranked{0};
    int volume_ranked{0};
    int missing_users{0};       // ranked members with no user row
};

/**
 * Copies live leaderboard positions into the durable per-user rank fields.
 *
 * Ranks are 1-based positions in descending score order. Members that have
 * no user row are counted and skipped. Only one sync runs at a time; an
 * overlapping call returns immediately with ran = false.
 */
class LeaderboardReconciler {
public:
    LeaderboardReconciler(std::shared_ptr<Database> db,
                          std::shared_ptr<RankedStore> store,
                          LeaderboardKeys keys = {});

    SyncResult sync_leaderboard_to_db();

    // Seeds both ranked sets from the users table; returns users loaded.
    size_t warm_cache_from_db();

    bool in_flight() const { return in_flight_.load(); }

private:
    std::shared_ptr<Database> db_;
    std::shared_ptr<RankedStore> store_;
    LeaderboardKeys keys_;
    std::atomic<bool> in_flight_{false};
};

} // namespace thisthat
