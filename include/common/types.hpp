#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>

namespace thisthat {

// All persisted timestamps are UTC microseconds since the epoch.
using ClockFn = std::function<int64_t()>;

inline int64_t now_micros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline ClockFn system_clock_fn() {
    return [] { return now_micros(); };
}

constexpr int64_t kMicrosPerSecond = 1'000'000;
constexpr int64_t kMicrosPerHour = 3600 * kMicrosPerSecond;
constexpr int64_t kMicrosPerDay = 24 * kMicrosPerHour;

std::string format_timestamp(int64_t micros);

// Side of a binary market
enum class Side {
    THIS,
    THAT
};

inline std::string to_string(Side s) {
    return s == Side::THIS ? "this" : "that";
}

std::optional<Side> side_from_string(const std::string& s);

// Bet lifecycle
enum class BetStatus {
    PENDING,
    WON,
    LOST,
    CANCELLED
};

inline std::string to_string(BetStatus s) {
    switch (s) {
        case BetStatus::PENDING: return "pending";
        case BetStatus::WON: return "won";
        case BetStatus::LOST: return "lost";
        case BetStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::optional<BetStatus> bet_status_from_string(const std::string& s);

inline bool is_terminal(BetStatus s) {
    return s != BetStatus::PENDING;
}

// Market status as reported by ingestion
enum class MarketStatus {
    OPEN,
    CLOSED,
    RESOLVED,
    INVALID
};

inline std::string to_string(MarketStatus s) {
    switch (s) {
        case MarketStatus::OPEN: return "open";
        case MarketStatus::CLOSED: return "closed";
        case MarketStatus::RESOLVED: return "resolved";
        case MarketStatus::INVALID: return "invalid";
    }
    return "unknown";
}

std::optional<MarketStatus> market_status_from_string(const std::string& s);

// Outcome of a resolved market
enum class Resolution {
    THIS,
    THAT,
    INVALID
};

inline std::string to_string(Resolution r) {
    switch (r) {
        case Resolution::THIS: return "this";
        case Resolution::THAT: return "that";
        case Resolution::INVALID: return "invalid";
    }
    return "unknown";
}

std::optional<Resolution> resolution_from_string(const std::string& s);

inline bool side_wins(Side side, Resolution r) {
    return (side == Side::THIS && r == Resolution::THIS) ||
           (side == Side::THAT && r == Resolution::THAT);
}

// Credit transaction kinds
enum class TransactionType {
    SIGNUP_BONUS,
    BET,
    PAYOUT,
    REFUND,
    POSITION_SOLD,
    DAILY_REWARD,
    CREDIT_PURCHASE,
    ADJUSTMENT
};

inline std::string to_string(TransactionType t) {
    switch (t) {
        case TransactionType::SIGNUP_BONUS: return "signup_bonus";
        case TransactionType::BET: return "bet";
        case TransactionType::PAYOUT: return "payout";
        case TransactionType::REFUND: return "refund";
        case TransactionType::POSITION_SOLD: return "position_sold";
        case TransactionType::DAILY_REWARD: return "daily_reward";
        case TransactionType::CREDIT_PURCHASE: return "credit_purchase";
        case TransactionType::ADJUSTMENT: return "adjustment";
    }
    return "unknown";
}

std::optional<TransactionType> transaction_type_from_string(const std::string& s);

// Fund reservation lifecycle
enum class HoldStatus {
    ACTIVE,
    RELEASED,
    CAPTURED
};

inline std::string to_string(HoldStatus s) {
    switch (s) {
        case HoldStatus::ACTIVE: return "active";
        case HoldStatus::RELEASED: return "released";
        case HoldStatus::CAPTURED: return "captured";
    }
    return "unknown";
}

std::optional<HoldStatus> hold_status_from_string(const std::string& s);

} // namespace thisthat
