#include "market/market_directory.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <future>
#include <system_error>
#include <thread>

namespace thisthat {

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const MarketRecord& m) {
    j = nlohmann::json{
        {"id", m.id},
        {"status", to_string(m.status)},
        {"this_price", m.this_price.to_string()},
        {"that_price", m.that_price.to_string()}
    };
    if (m.external_id) j["external_id"] = *m.external_id;
    if (m.expires_at) j["expires_at"] = *m.expires_at;
    if (m.resolution) j["resolution"] = to_string(*m.resolution);
}

namespace {

Probability read_price(const nlohmann::json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_string()) {
        return Probability::parse(v.get<std::string>());
    }
    // Feeds may carry plain numbers; go through text so the value is exact
    return Probability::parse(fmt::format("{:.6f}", v.get<double>()));
}

} // namespace

void from_json(const nlohmann::json& j, MarketRecord& m) {
    j.at("id").get_to(m.id);

    auto status = market_status_from_string(j.value("status", std::string("open")));
    if (!status) {
        throw std::invalid_argument("Unknown market status for " + m.id);
    }
    m.status = *status;

    if (j.contains("external_id")) m.external_id = j.at("external_id").get<std::string>();
    if (j.contains("expires_at")) m.expires_at = j.at("expires_at").get<int64_t>();
    m.this_price = read_price(j, "this_price");
    m.that_price = read_price(j, "that_price");

    if (j.contains("resolution") && !j.at("resolution").is_null()) {
        auto r = resolution_from_string(j.at("resolution").get<std::string>());
        if (!r) {
            throw std::invalid_argument("Unknown resolution for " + m.id);
        }
        m.resolution = *r;
    }
}

// ============================================================================
// DIRECTORY
// ============================================================================

void MarketDirectory::upsert(const MarketRecord& market) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = markets_.find(market.id);
    if (existing != markets_.end() && existing->second.external_id) {
        external_index_.erase(*existing->second.external_id);
    }
    markets_[market.id] = market;
    if (market.external_id) {
        external_index_[*market.external_id] = market.id;
    }
}

bool MarketDirectory::remove(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        return false;
    }
    if (it->second.external_id) {
        external_index_.erase(*it->second.external_id);
    }
    markets_.erase(it);
    return true;
}

std::optional<MarketRecord> MarketDirectory::find_market(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = markets_.find(identifier);
    if (it != markets_.end()) {
        return it->second;
    }
    auto ext = external_index_.find(identifier);
    if (ext != external_index_.end()) {
        return markets_.at(ext->second);
    }
    return std::nullopt;
}

std::vector<ResolutionEvent> MarketDirectory::poll_resolved() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ResolutionEvent> events;
    for (const auto& [id, market] : markets_) {
        if (market.status == MarketStatus::RESOLVED && market.resolution) {
            events.push_back({id, *market.resolution});
        } else if (market.status == MarketStatus::INVALID) {
            events.push_back({id, Resolution::INVALID});
        }
    }
    return events;
}

size_t MarketDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return markets_.size();
}

size_t MarketDirectory::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open market file: " + path);
    }

    nlohmann::json j;
    file >> j;

    auto markets = j.get<std::vector<MarketRecord>>();
    for (const auto& m : markets) {
        upsert(m);
    }
    spdlog::info("Loaded {} markets from {}", markets.size(), path);
    return markets.size();
}

// ============================================================================
// GATE
// ============================================================================

namespace {

// Returns a worker slot when the lookup thread finishes
class PendingSlot {
public:
    explicit PendingSlot(std::shared_ptr<std::atomic<int>> pending) : pending_(std::move(pending)) {}
    ~PendingSlot() { pending_->fetch_sub(1); }

    PendingSlot(const PendingSlot&) = delete;
    PendingSlot& operator=(const PendingSlot&) = delete;

private:
    std::shared_ptr<std::atomic<int>> pending_;
};

} // namespace

MarketGate::MarketGate(std::shared_ptr<MarketSource> source, std::chrono::milliseconds timeout,
                       int max_pending)
    : source_(std::move(source))
    , timeout_(timeout)
    , max_pending_(max_pending)
    , pending_(std::make_shared<std::atomic<int>>(0))
{
    if (!source_) {
        throw std::invalid_argument("MarketGate requires a market source");
    }
    if (max_pending_ <= 0) {
        throw std::invalid_argument("MarketGate requires a positive max_pending");
    }
}

std::optional<MarketRecord> MarketGate::lookup(const std::string& identifier) {
    if (pending_->fetch_add(1) >= max_pending_) {
        pending_->fetch_sub(1);
        METRIC_COUNTER("market_lookups_refused").increment();
        spdlog::warn("Market lookup for {} refused: {} lookups outstanding", identifier, max_pending_);
        throw ServiceUnavailable("Market source saturated: " + identifier);
    }

    auto promise = std::make_shared<std::promise<std::optional<MarketRecord>>>();
    auto future = promise->get_future();

    // Detached so a hung source cannot block the caller past the timeout.
    // The worker keeps the source, promise and its slot alive through its
    // captures.
    try {
        std::thread([source = source_, promise, identifier, pending = pending_]() {
            PendingSlot slot(pending);
            try {
                promise->set_value(source->find_market(identifier));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    } catch (const std::system_error& e) {
        pending_->fetch_sub(1);
        throw ServiceUnavailable(std::string("Market lookup could not start: ") + e.what());
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        spdlog::warn("Market lookup for {} timed out after {}ms", identifier, timeout_.count());
        throw ServiceUnavailable("Market lookup timed out: " + identifier);
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        spdlog::warn("Market lookup for {} failed: {}", identifier, e.what());
        throw ServiceUnavailable(std::string("Market lookup failed: ") + e.what());
    }
}

MarketRecord MarketGate::require_open(const std::string& identifier, int64_t now) {
    auto market = lookup(identifier);
    if (!market) {
        throw MarketNotOpen("Unknown market: " + identifier);
    }
    if (!market->accepts_bets_at(now)) {
        throw MarketNotOpen(fmt::format("Market {} is {}{}", market->id, to_string(market->status),
                                        market->status == MarketStatus::OPEN ? " (expired)" : ""));
    }
    return *market;
}

} // namespace thisthat
