#pragma once

#include "common/decimal.hpp"
#include "ledger/ledger.hpp"

#include <memory>
#include <string>

namespace thisthat {

struct DailyClaimResult {
    Credits credits_awarded;
    int consecutive_days{0};
    int64_t next_available_at{0};   // next UTC midnight
};

// First ever claim pays 500. Streak days 1-3 pay 100; from day 4 the reward
// grows by 50 every two days: 100 + floor((streak - 2) / 2) * 50.
Credits calculate_daily_credits(int consecutive_days, bool first_claim);

// Start of the UTC day containing micros.
int64_t utc_day_start(int64_t micros);

/**
 * One reward claim per UTC day, credited to the ledger as daily_reward.
 */
class DailyCredits {
public:
    explicit DailyCredits(std::shared_ptr<Ledger> ledger);

    // Throws ValidationError when the user already claimed today.
    DailyClaimResult claim(const std::string& user_id);

private:
    std::shared_ptr<Ledger> ledger_;
};

} // namespace thisthat
