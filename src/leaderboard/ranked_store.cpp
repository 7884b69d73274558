#include "leaderboard/ranked_store.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace thisthat {

// ============================================================================
// IN-MEMORY STORE
// ============================================================================

void InMemoryRankedStore::set_score(const std::string& key, const std::string& member,
                                    Decimal score) {
    std::lock_guard<std::mutex> lock(mutex_);
    sets_[key][member] = score;
}

std::vector<RankedEntry> InMemoryRankedStore::members_descending(const std::string& key) {
    std::vector<RankedEntry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sets_.find(key);
        if (it == sets_.end()) {
            return entries;
        }
        entries.reserve(it->second.size());
        for (const auto& [member, score] : it->second) {
            entries.push_back({member, score});
        }
    }

    std::sort(entries.begin(), entries.end(), [](const RankedEntry& a, const RankedEntry& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.member > b.member;
    });
    return entries;
}

bool InMemoryRankedStore::remove(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sets_.find(key);
    return it != sets_.end() && it->second.erase(member) > 0;
}

void InMemoryRankedStore::clear(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    sets_.erase(key);
}

// ============================================================================
// PUBLISHER
// ============================================================================

ScorePublisher::ScorePublisher(std::shared_ptr<RankedStore> store, LeaderboardKeys keys)
    : store_(std::move(store))
    , keys_(std::move(keys))
{
    if (!store_) {
        throw std::invalid_argument("ScorePublisher requires a ranked store");
    }
}

bool ScorePublisher::publish(const UserRecord& user) {
    try {
        store_->set_score(keys_.pnl, user.id, user.overall_pnl);
        store_->set_score(keys_.volume, user.id, user.total_volume);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to publish leaderboard scores for {}: {}", user.id, e.what());
        return false;
    }
}

} // namespace thisthat
