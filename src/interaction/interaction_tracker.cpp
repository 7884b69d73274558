#include "interaction/interaction_tracker.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace thisthat {

InteractionTracker::InteractionTracker(std::shared_ptr<Database> db,
                                       std::chrono::hours ttl,
                                       ClockFn clock)
    : db_(std::move(db))
    , ttl_(ttl)
    , clock_(clock ? std::move(clock) : system_clock_fn())
{
    if (!db_) {
        throw std::invalid_argument("InteractionTracker requires a database");
    }
}

SkipResult InteractionTracker::skip(const std::string& user_id, const std::string& market_id) {
    if (user_id.empty() || market_id.empty()) {
        throw ValidationError("skip requires user_id and market_id");
    }

    InteractionRecord record;
    record.user_id = user_id;
    record.market_id = market_id;
    record.action = "skip";
    record.timestamp = clock_();
    record.expires_at = record.timestamp +
        std::chrono::duration_cast<std::chrono::microseconds>(ttl_).count();

    db_->upsert_interaction(record);
    spdlog::debug("User {} skipped market {} until {}",
                  user_id, market_id, format_timestamp(record.expires_at));

    return SkipResult{true, record.expires_at};
}

std::set<std::string> InteractionTracker::list_skipped(const std::string& user_id) {
    std::set<std::string> markets;
    for (const auto& record : db_->get_active_skips(user_id, clock_())) {
        markets.insert(record.market_id);
    }
    return markets;
}

bool InteractionTracker::remove_skip(const std::string& user_id, const std::string& market_id) {
    return db_->remove_interaction(user_id, market_id);
}

int InteractionTracker::cleanup_expired() {
    int removed = db_->delete_expired_interactions(clock_());
    if (removed > 0) {
        spdlog::info("Cleaned up {} expired skip records", removed);
    }
    return removed;
}

} // namespace thisthat
