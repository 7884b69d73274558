#include <gtest/gtest.h>
#include "economy/daily_credits.hpp"
#include "common/errors.hpp"
#include <filesystem>

using namespace thisthat;

TEST(DailyCreditsCalculationTest, RewardSchedule) {
    EXPECT_EQ(calculate_daily_credits(1, true), Credits::from_whole(500));
    EXPECT_EQ(calculate_daily_credits(1, false), Credits::from_whole(100));
    EXPECT_EQ(calculate_daily_credits(3, false), Credits::from_whole(100));
    EXPECT_EQ(calculate_daily_credits(4, false), Credits::from_whole(150));
    EXPECT_EQ(calculate_daily_credits(5, false), Credits::from_whole(150));
    EXPECT_EQ(calculate_daily_credits(6, false), Credits::from_whole(200));
    EXPECT_EQ(calculate_daily_credits(10, false), Credits::from_whole(300));
}

TEST(DailyCreditsCalculationTest, UtcDayStart) {
    int64_t ts = 1'700'000'000'000'000;   // 2023-11-14 22:13:20 UTC
    int64_t start = utc_day_start(ts);
    EXPECT_EQ(start % kMicrosPerDay, 0);
    EXPECT_LE(start, ts);
    EXPECT_GT(start + kMicrosPerDay, ts);
    EXPECT_EQ(utc_day_start(start), start);
}

class DailyCreditsTest : public ::testing::Test {
protected:
    std::string test_db_path_;
    std::shared_ptr<Database> db_;
    std::shared_ptr<Ledger> ledger_;
    std::unique_ptr<DailyCredits> daily_;
    int64_t now_{0};

    void SetUp() override {
        test_db_path_ = "/tmp/test_daily_" + generate_uuid() + ".db";
        db_ = std::make_shared<Database>(test_db_path_);
        db_->initialize_schema();
        now_ = utc_day_start(1'700'000'000'000'000) + 10 * kMicrosPerHour;
        ledger_ = std::make_shared<Ledger>(db_, [this] { return now_; });
        daily_ = std::make_unique<DailyCredits>(ledger_);
        ledger_->open_account("alice", Credits::from_whole(1000));
    }

    void TearDown() override {
        daily_.reset();
        ledger_.reset();
        db_.reset();
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

TEST_F(DailyCreditsTest, FirstClaimPaysWelcomeReward) {
    auto result = daily_->claim("alice");
    EXPECT_EQ(result.credits_awarded, Credits::from_whole(500));
    EXPECT_EQ(result.consecutive_days, 1);
    EXPECT_EQ(result.next_available_at, utc_day_start(now_) + kMicrosPerDay);

    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1500));
    EXPECT_EQ(ledger_->list_transactions("alice", TransactionType::DAILY_REWARD).total, 1);
}

TEST_F(DailyCreditsTest, SecondClaimSameDayRejected) {
    daily_->claim("alice");
    now_ += 2 * kMicrosPerHour;
    EXPECT_THROW(daily_->claim("alice"), ValidationError);
    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1500));
}

TEST_F(DailyCreditsTest, StreakGrowsOnConsecutiveDays) {
    daily_->claim("alice");
    int expected_streak = 1;
    for (int day = 1; day <= 3; ++day) {
        now_ += kMicrosPerDay;
        auto result = daily_->claim("alice");
        ++expected_streak;
        EXPECT_EQ(result.consecutive_days, expected_streak);
    }
    auto user = db_->get_user("alice");
    EXPECT_EQ(user->consecutive_days_online, 4);
    // 500 + 100 + 100 + 150
    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1850));
}

TEST_F(DailyCreditsTest, MissedDayResetsStreak) {
    daily_->claim("alice");
    now_ += kMicrosPerDay;
    daily_->claim("alice");

    now_ += 2 * kMicrosPerDay;
    auto result = daily_->claim("alice");
    EXPECT_EQ(result.consecutive_days, 1);
    EXPECT_EQ(result.credits_awarded, Credits::from_whole(100));
}

TEST_F(DailyCreditsTest, UnknownUser) {
    EXPECT_THROW(daily_->claim("ghost"), NotFound);
}
