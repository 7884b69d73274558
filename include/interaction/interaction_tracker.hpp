#pragma once

#include "common/types.hpp"
#include "persistence/database.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>

namespace thisthat {

struct SkipResult {
    bool success{false};
    int64_t expires_at{0};
};

/**
 * Records markets a user has swiped past so they stay out of the feed for a
 * while. One record per (user, market); skipping again refreshes the TTL.
 */
class InteractionTracker {
public:
    static constexpr std::chrono::hours kDefaultTtl{72};

    InteractionTracker(std::shared_ptr<Database> db,
                       std::chrono::hours ttl = kDefaultTtl,
                       ClockFn clock = system_clock_fn());

    SkipResult skip(const std::string& user_id, const std::string& market_id);

    // Markets whose skip has not yet expired.
    std::set<std::string> list_skipped(const std::string& user_id);

    // Returns false when there was nothing to remove.
    bool remove_skip(const std::string& user_id, const std::string& market_id);

    // Deletes every record with expires_at <= now; returns the count.
    int cleanup_expired();

private:
    std::shared_ptr<Database> db_;
    std::chrono::hours ttl_;
    ClockFn clock_;
};

} // namespace thisthat
