#include "economy/daily_credits.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace thisthat {

namespace {
constexpr int64_t kFirstClaimCredits = 500;
constexpr int64_t kBaseDailyCredits = 100;
constexpr int64_t kStreakIncrement = 50;
constexpr int kStreakInterval = 2;
}

Credits calculate_daily_credits(int consecutive_days, bool first_claim) {
    if (first_claim) {
        return Credits::from_whole(kFirstClaimCredits);
    }

    int streak = std::max(1, consecutive_days);
    if (streak <= 3) {
        return Credits::from_whole(kBaseDailyCredits);
    }

    int64_t bonus_steps = (streak - 2) / kStreakInterval;
    return Credits::from_whole(kBaseDailyCredits + bonus_steps * kStreakIncrement);
}

int64_t utc_day_start(int64_t micros) {
    int64_t day = micros / kMicrosPerDay;
    if (micros < 0 && micros % kMicrosPerDay != 0) {
        --day;
    }
    return day * kMicrosPerDay;
}

DailyCredits::DailyCredits(std::shared_ptr<Ledger> ledger)
    : ledger_(std::move(ledger))
{
    if (!ledger_) {
        throw std::invalid_argument("DailyCredits requires a ledger");
    }
}

DailyClaimResult DailyCredits::claim(const std::string& user_id) {
    Database& db = ledger_->database();
    TransactionGuard guard(db);

    auto user = db.get_user(user_id);
    if (!user) {
        throw NotFound("Unknown user: " + user_id);
    }

    int64_t now = ledger_->now();
    int64_t today = utc_day_start(now);
    bool first_claim = !user->last_daily_reward_at;

    int consecutive = 1;
    if (!first_claim) {
        int64_t last_day = utc_day_start(*user->last_daily_reward_at);
        if (last_day >= today) {
            throw ValidationError("Daily credits already claimed; next claim at " +
                                  format_timestamp(today + kMicrosPerDay));
        }
        if (today - last_day == kMicrosPerDay) {
            consecutive = user->consecutive_days_online + 1;
        }
    }

    Credits awarded = calculate_daily_credits(consecutive, first_claim);
    ledger_->credit(user_id, awarded, TransactionType::DAILY_REWARD, "daily:" + std::to_string(today));
    db.update_daily_reward(user_id, consecutive, now);
    guard.commit();

    spdlog::info("User {} claimed {} daily credits (streak {})",
                 user_id, awarded.to_string(), consecutive);
    return DailyClaimResult{awarded, consecutive, today + kMicrosPerDay};
}

} // namespace thisthat
