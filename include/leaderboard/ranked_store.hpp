#pragma once

#include "common/decimal.hpp"
#include "persistence/database.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace thisthat {

struct RankedEntry {
    std::string member;
    Decimal score;
};

struct LeaderboardKeys {
    std::string pnl{"leaderboard:live:pnl"};
    std::string volume{"leaderboard:live:volume"};
};

/**
 * Sorted-set style score store keyed by leaderboard name.
 */
class RankedStore {
public:
    virtual ~RankedStore() = default;

    virtual void set_score(const std::string& key, const std::string& member, Decimal score) = 0;
    // Highest score first; equal scores ordered by member id descending.
    virtual std::vector<RankedEntry> members_descending(const std::string& key) = 0;
    virtual bool remove(const std::string& key, const std::string& member) = 0;
    virtual void clear(const std::string& key) = 0;
};

class InMemoryRankedStore : public RankedStore {
public:
    void set_score(const std::string& key, const std::string& member, Decimal score) override;
    std::vector<RankedEntry> members_descending(const std::string& key) override;
    bool remove(const std::string& key, const std::string& member) override;
    void clear(const std::string& key) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::map<std::string, Decimal>> sets_;
};

/**
 * Pushes a user's current PnL and volume into the live leaderboards.
 * Best effort: failures are logged and reported, never thrown.
 */
class ScorePublisher {
public:
    ScorePublisher(std::shared_ptr<RankedStore> store, LeaderboardKeys keys = {});

    bool publish(const UserRecord& user);

    RankedStore& store() { return *store_; }
    const LeaderboardKeys& keys() const { return keys_; }

private:
    std::shared_ptr<RankedStore> store_;
    LeaderboardKeys keys_;
};

} // namespace thisthat
