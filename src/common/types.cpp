#include "common/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace thisthat {

std::string format_timestamp(int64_t micros) {
    auto seconds = micros / kMicrosPerSecond;
    auto us = micros % kMicrosPerSecond;
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << us;
    return ss.str();
}

std::optional<Side> side_from_string(const std::string& s) {
    if (s == "this") return Side::THIS;
    if (s == "that") return Side::THAT;
    return std::nullopt;
}

std::optional<BetStatus> bet_status_from_string(const std::string& s) {
    if (s == "pending") return BetStatus::PENDING;
    if (s == "won") return BetStatus::WON;
    if (s == "lost") return BetStatus::LOST;
    if (s == "cancelled") return BetStatus::CANCELLED;
    return std::nullopt;
}

std::optional<MarketStatus> market_status_from_string(const std::string& s) {
    if (s == "open") return MarketStatus::OPEN;
    if (s == "closed") return MarketStatus::CLOSED;
    if (s == "resolved") return MarketStatus::RESOLVED;
    if (s == "invalid") return MarketStatus::INVALID;
    return std::nullopt;
}

std::optional<Resolution> resolution_from_string(const std::string& s) {
    if (s == "this") return Resolution::THIS;
    if (s == "that") return Resolution::THAT;
    if (s == "invalid") return Resolution::INVALID;
    return std::nullopt;
}

std::optional<TransactionType> transaction_type_from_string(const std::string& s) {
    if (s == "signup_bonus") return TransactionType::SIGNUP_BONUS;
    if (s == "bet") return TransactionType::BET;
    if (s == "payout") return TransactionType::PAYOUT;
    if (s == "refund") return TransactionType::REFUND;
    if (s == "position_sold") return TransactionType::POSITION_SOLD;
    if (s == "daily_reward") return TransactionType::DAILY_REWARD;
    if (s == "credit_purchase") return TransactionType::CREDIT_PURCHASE;
    if (s == "adjustment") return TransactionType::ADJUSTMENT;
    return std::nullopt;
}

std::optional<HoldStatus> hold_status_from_string(const std::string& s) {
    if (s == "active") return HoldStatus::ACTIVE;
    if (s == "released") return HoldStatus::RELEASED;
    if (s == "captured") return HoldStatus::CAPTURED;
    return std::nullopt;
}

} // namespace thisthat
