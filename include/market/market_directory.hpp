#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace thisthat {

/**
 * Market as published by the ingestion side. Read only to this core.
 */
struct MarketRecord {
    std::string id;
    std::optional<std::string> external_id;
    MarketStatus status{MarketStatus::OPEN};
    std::optional<int64_t> expires_at;
    Probability this_price;
    Probability that_price;
    std::optional<Resolution> resolution;

    bool accepts_bets_at(int64_t now) const {
        return status == MarketStatus::OPEN && (!expires_at || *expires_at > now);
    }

    Probability price_for(Side side) const {
        return side == Side::THIS ? this_price : that_price;
    }
};

void to_json(nlohmann::json& j, const MarketRecord& m);
void from_json(const nlohmann::json& j, MarketRecord& m);

struct ResolutionEvent {
    std::string market_id;
    Resolution resolution{Resolution::INVALID};
};

/**
 * Lookup of a market by internal id or external correlation id.
 */
class MarketSource {
public:
    virtual ~MarketSource() = default;
    virtual std::optional<MarketRecord> find_market(const std::string& identifier) = 0;
};

/**
 * Source of markets that have reached a final outcome.
 */
class ResolutionSource {
public:
    virtual ~ResolutionSource() = default;
    virtual std::vector<ResolutionEvent> poll_resolved() = 0;
};

/**
 * In-process market directory fed by ingestion. Thread-safe.
 */
class MarketDirectory : public MarketSource, public ResolutionSource {
public:
    void upsert(const MarketRecord& market);
    // Retires a market; returns false if it was not present.
    bool remove(const std::string& market_id);
    std::optional<MarketRecord> find_market(const std::string& identifier) override;
    std::vector<ResolutionEvent> poll_resolved() override;
    size_t size() const;

    // Loads a JSON array of markets; returns the number loaded.
    size_t load_file(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, MarketRecord> markets_;
    std::map<std::string, std::string> external_index_;  // external_id -> id
};

/**
 * Bounded-timeout front for a MarketSource.
 *
 * The lookup runs on a worker thread; if it has not answered within the
 * timeout the call fails closed with ServiceUnavailable and the late answer
 * is discarded. At most max_pending workers exist at once, including ones
 * still stuck in a source that timed out; beyond that lookups are refused
 * with ServiceUnavailable until a worker returns.
 */
class MarketGate {
public:
    static constexpr int kDefaultMaxPending = 16;

    MarketGate(std::shared_ptr<MarketSource> source, std::chrono::milliseconds timeout,
               int max_pending = kDefaultMaxPending);

    std::optional<MarketRecord> lookup(const std::string& identifier);

    // Throws MarketNotOpen for unknown, closed, resolved or expired markets.
    MarketRecord require_open(const std::string& identifier, int64_t now);

    int pending_lookups() const { return pending_->load(); }

private:
    std::shared_ptr<MarketSource> source_;
    std::chrono::milliseconds timeout_;
    int max_pending_;
    // Shared with workers, which may outlive the gate
    std::shared_ptr<std::atomic<int>> pending_;
};

} // namespace thisthat
