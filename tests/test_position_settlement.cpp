#include <gtest/gtest.h>
#include "settlement/position_settlement.hpp"
#include "common/errors.hpp"
#include <filesystem>

using namespace thisthat;

class PositionSettlementTest : public ::testing::Test {
protected:
    std::string test_db_path_;
    std::shared_ptr<Database> db_;
    std::shared_ptr<Ledger> ledger_;
    std::shared_ptr<SharePricing> pricing_;
    std::shared_ptr<InMemoryRankedStore> ranked_;
    std::unique_ptr<PositionSettlement> settlement_;
    int64_t now_{1'700'000'000'000'000};

    void SetUp() override {
        test_db_path_ = "/tmp/test_settlement_" + generate_uuid() + ".db";
        db_ = std::make_shared<Database>(test_db_path_);
        db_->initialize_schema();

        ClockFn clock = [this] { return now_; };
        ledger_ = std::make_shared<Ledger>(db_, clock);
        pricing_ = std::make_shared<SharePricing>();
        ranked_ = std::make_shared<InMemoryRankedStore>();
        settlement_ = std::make_unique<PositionSettlement>(ledger_, pricing_, clock);
        settlement_->set_score_publisher(std::make_shared<ScorePublisher>(ranked_));
    }

    void TearDown() override {
        settlement_.reset();
        ledger_.reset();
        db_.reset();
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }

    // Debits the stake and records a pending bet priced at 0.5
    BetRecord stake(const std::string& user, const std::string& market, Side side, int64_t amount) {
        BetRecord bet;
        bet.id = generate_uuid();
        bet.user_id = user;
        bet.market_id = market;
        bet.side = side;
        bet.amount = Credits::from_whole(amount);
        bet.price_at_bet = Probability::parse("0.5");
        bet.shares = Credits::from_whole(amount * 2);
        bet.potential_payout = bet.shares;
        bet.created_at = now_++;

        TransactionGuard guard(*db_);
        db_->insert_bet(bet);
        ledger_->debit(user, bet.amount, TransactionType::BET, bet.id);
        db_->add_user_stats(user, Credits(), bet.amount);
        guard.commit();
        return bet;
    }
};

// ============================================================================
// Outcomes
// ============================================================================

TEST_F(PositionSettlementTest, InvalidMarketRefundsEveryStake) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    ledger_->open_account("bob", Credits::from_whole(1000));

    stake("alice", "m1", Side::THIS, 20);
    stake("alice", "m1", Side::THAT, 30);
    stake("bob", "m1", Side::THIS, 40);

    auto result = settlement_->settle_positions_for_market("m1", Resolution::INVALID);

    EXPECT_EQ(result.settled, 3);
    EXPECT_EQ(result.cancelled, 3);
    EXPECT_EQ(result.errors, 0);
    EXPECT_EQ(result.total_payout, Credits::from_whole(90));

    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1000));
    EXPECT_EQ(ledger_->get_balance("bob").balance, Credits::from_whole(1000));

    for (const auto& bet : db_->list_bets_for_user("alice", std::nullopt, 10, 0)) {
        EXPECT_EQ(bet.status, BetStatus::CANCELLED);
        EXPECT_EQ(bet.actual_payout, bet.amount);
    }
    EXPECT_EQ(ledger_->list_transactions("alice", TransactionType::REFUND).total, 2);
}

TEST_F(PositionSettlementTest, WinnersPaidLosersRecorded) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    ledger_->open_account("bob", Credits::from_whole(1000));

    BetRecord win = stake("alice", "m1", Side::THIS, 50);
    BetRecord loss = stake("bob", "m1", Side::THAT, 30);

    auto result = settlement_->settle_positions_for_market("m1", Resolution::THIS);
    EXPECT_EQ(result.won, 1);
    EXPECT_EQ(result.lost, 1);
    EXPECT_EQ(result.total_payout, Credits::from_whole(100));

    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1050));
    EXPECT_EQ(ledger_->get_balance("bob").balance, Credits::from_whole(970));

    auto won = db_->get_bet(win.id);
    EXPECT_EQ(won->status, BetStatus::WON);
    EXPECT_EQ(won->actual_payout, Credits::from_whole(100));
    EXPECT_TRUE(won->resolved_at.has_value());

    auto lost = db_->get_bet(loss.id);
    EXPECT_EQ(lost->status, BetStatus::LOST);
    EXPECT_EQ(lost->actual_payout, Credits());

    EXPECT_EQ(db_->get_user("alice")->overall_pnl, Credits::from_whole(50));
    EXPECT_EQ(db_->get_user("alice")->biggest_win, Credits::from_whole(50));
    EXPECT_EQ(db_->get_user("bob")->overall_pnl, Credits::from_whole(-30));

    auto pnl = ranked_->members_descending(LeaderboardKeys{}.pnl);
    ASSERT_EQ(pnl.size(), 2u);
    EXPECT_EQ(pnl[0].member, "alice");
    EXPECT_EQ(pnl[1].member, "bob");

    EXPECT_TRUE(ledger_->verify_user("alice").consistent);
    EXPECT_TRUE(ledger_->verify_user("bob").consistent);
}

TEST_F(PositionSettlementTest, OnlyTargetMarketSettles) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    stake("alice", "m1", Side::THIS, 10);
    BetRecord other = stake("alice", "m2", Side::THIS, 10);

    settlement_->settle_positions_for_market("m1", Resolution::THAT);
    EXPECT_EQ(db_->get_bet(other.id)->status, BetStatus::PENDING);
}

// ============================================================================
// Idempotence and Failures
// ============================================================================

TEST_F(PositionSettlementTest, SecondRunPaysNothing) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    stake("alice", "m1", Side::THIS, 50);

    auto first = settlement_->settle_positions_for_market("m1", Resolution::THIS);
    EXPECT_EQ(first.settled, 1);
    Credits after_first = ledger_->get_balance("alice").balance;

    auto second = settlement_->settle_positions_for_market("m1", Resolution::THIS);
    EXPECT_TRUE(second.already_settled);
    EXPECT_EQ(second.settled, 0);
    EXPECT_EQ(second.total_payout, Credits());
    EXPECT_EQ(ledger_->get_balance("alice").balance, after_first);
    EXPECT_EQ(ledger_->list_transactions("alice", TransactionType::PAYOUT).total, 1);
}

TEST_F(PositionSettlementTest, FailedBetDoesNotStopBatch) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    ledger_->open_account("bob", Credits::from_whole(1000));

    BetRecord broken = stake("alice", "m1", Side::THIS, 20);
    BetRecord healthy = stake("bob", "m1", Side::THIS, 20);

    // A payout that would overflow fails only that bet
    db_->execute("UPDATE bets SET shares = 9223372036854775807 WHERE id = '" + broken.id + "';");

    auto result = settlement_->settle_positions_for_market("m1", Resolution::THIS);
    EXPECT_EQ(result.errors, 1);
    EXPECT_EQ(result.won, 1);

    EXPECT_EQ(db_->get_bet(broken.id)->status, BetStatus::PENDING);
    EXPECT_EQ(db_->get_bet(healthy.id)->status, BetStatus::WON);
    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(980));
    EXPECT_FALSE(db_->in_transaction());
}
