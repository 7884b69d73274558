#include <gtest/gtest.h>
#include "ledger/ledger.hpp"
#include "common/errors.hpp"
#include <atomic>
#include <filesystem>
#include <thread>

using namespace thisthat;

class LedgerTest : public ::testing::Test {
protected:
    std::string test_db_path_;
    std::shared_ptr<Database> db_;
    std::shared_ptr<Ledger> ledger_;
    int64_t now_{1'700'000'000'000'000};

    void SetUp() override {
        test_db_path_ = "/tmp/test_ledger_" + generate_uuid() + ".db";
        db_ = std::make_shared<Database>(test_db_path_);
        db_->initialize_schema();
        ledger_ = std::make_shared<Ledger>(db_, [this] { return now_; });
    }

    void TearDown() override {
        ledger_.reset();
        db_.reset();
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

// ============================================================================
// Accounts
// ============================================================================

TEST_F(LedgerTest, OpenAccountBooksSignupBonus) {
    Balance b = ledger_->open_account("alice", Credits::from_whole(1000));
    EXPECT_EQ(b.balance, Credits::from_whole(1000));
    EXPECT_EQ(b.available, Credits::from_whole(1000));

    auto page = ledger_->list_transactions("alice");
    ASSERT_EQ(page.total, 1);
    EXPECT_EQ(page.transactions[0].type, TransactionType::SIGNUP_BONUS);
    EXPECT_EQ(page.transactions[0].balance_after, Credits::from_whole(1000));
    EXPECT_EQ(page.transactions[0].sequence, 1);
}

TEST_F(LedgerTest, OpenAccountTwiceDoesNotGrantAgain) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    Balance b = ledger_->open_account("alice", Credits::from_whole(1000));
    EXPECT_EQ(b.balance, Credits::from_whole(1000));
    EXPECT_EQ(ledger_->list_transactions("alice").total, 1);
}

TEST_F(LedgerTest, OpenAccountUsesConfiguredSignupBonus) {
    Config config;
    config.economy.signup_bonus = Credits::from_whole(250);
    Ledger ledger(db_, ledger_config_from(config), [this] { return now_; });

    Balance b = ledger.open_account("bob");
    EXPECT_EQ(b.balance, Credits::from_whole(250));

    auto page = ledger.list_transactions("bob", TransactionType::SIGNUP_BONUS);
    ASSERT_EQ(page.total, 1);
    EXPECT_EQ(page.transactions[0].amount, Credits::from_whole(250));
}

TEST_F(LedgerTest, DefaultSignupBonusMatchesEconomyDefault) {
    EXPECT_EQ(ledger_->open_account("carol").balance, Config{}.economy.signup_bonus);
}

TEST_F(LedgerTest, UnknownUserIsNotFound) {
    EXPECT_THROW(ledger_->get_balance("ghost"), NotFound);
    EXPECT_THROW(ledger_->list_transactions("ghost"), NotFound);
    EXPECT_THROW(ledger_->credit("ghost", Credits::from_whole(1), TransactionType::ADJUSTMENT, "x"),
                 NotFound);
}

// ============================================================================
// Credit / Debit
// ============================================================================

TEST_F(LedgerTest, CreditAndDebitAppendRows) {
    ledger_->open_account("alice", Credits::from_whole(1000));

    auto debit = ledger_->debit("alice", Credits::from_whole(50), TransactionType::BET, "bet-1");
    EXPECT_EQ(debit.amount, Credits::from_whole(-50));
    EXPECT_EQ(debit.balance_after, Credits::from_whole(950));

    auto credit = ledger_->credit("alice", Credits::from_whole(95), TransactionType::PAYOUT, "bet-1");
    EXPECT_EQ(credit.balance_after, Credits::from_whole(1045));
    EXPECT_EQ(credit.sequence, 3);

    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1045));
}

TEST_F(LedgerTest, DebitBeyondBalanceLeavesNoTrace) {
    ledger_->open_account("alice", Credits::from_whole(5));

    EXPECT_THROW(ledger_->debit("alice", Credits::from_whole(10), TransactionType::BET, "bet-1"),
                 InsufficientFunds);

    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(5));
    EXPECT_EQ(ledger_->list_transactions("alice").total, 1);
    EXPECT_FALSE(db_->in_transaction());
}

TEST_F(LedgerTest, NonPositiveAmountsRejected) {
    ledger_->open_account("alice", Credits::from_whole(100));
    EXPECT_THROW(ledger_->credit("alice", Credits(), TransactionType::ADJUSTMENT, "x"), ValidationError);
    EXPECT_THROW(ledger_->debit("alice", Credits::from_whole(-5), TransactionType::BET, "x"), ValidationError);
    EXPECT_THROW(ledger_->open_account("bob", Credits::from_whole(-1)), ValidationError);
}

// ============================================================================
// Holds
// ============================================================================

TEST_F(LedgerTest, HoldReducesAvailableButNotBalance) {
    ledger_->open_account("alice", Credits::from_whole(100));
    HoldRecord hold = ledger_->place_hold("alice", Credits::from_whole(70), "bet", "k1");

    Balance b = ledger_->get_balance("alice");
    EXPECT_EQ(b.balance, Credits::from_whole(100));
    EXPECT_EQ(b.held, Credits::from_whole(70));
    EXPECT_EQ(b.available, Credits::from_whole(30));

    EXPECT_THROW(ledger_->place_hold("alice", Credits::from_whole(40), "bet", "k2"), InsufficientFunds);
    EXPECT_THROW(ledger_->debit("alice", Credits::from_whole(40), TransactionType::BET, "x"), InsufficientFunds);

    EXPECT_TRUE(ledger_->release_hold(hold.id));
    EXPECT_FALSE(ledger_->release_hold(hold.id));
    EXPECT_EQ(ledger_->get_balance("alice").available, Credits::from_whole(100));
}

TEST_F(LedgerTest, CaptureHoldDebitsOnce) {
    ledger_->open_account("alice", Credits::from_whole(100));
    HoldRecord hold = ledger_->place_hold("alice", Credits::from_whole(60), "bet", "k1");

    auto tx = ledger_->capture_hold(hold.id, TransactionType::BET, "bet-1");
    EXPECT_EQ(tx.balance_after, Credits::from_whole(40));
    EXPECT_EQ(ledger_->get_balance("alice").held, Credits());

    EXPECT_THROW(ledger_->capture_hold(hold.id, TransactionType::BET, "bet-1"), ValidationError);
    EXPECT_FALSE(ledger_->release_hold(hold.id));
    EXPECT_THROW(ledger_->release_hold("missing"), NotFound);
}

TEST_F(LedgerTest, ExpiredHoldNoLongerReserves) {
    ledger_->open_account("alice", Credits::from_whole(100));
    ledger_->place_hold("alice", Credits::from_whole(100), "bet", "k1", std::chrono::seconds(30));
    EXPECT_EQ(ledger_->get_balance("alice").available, Credits());

    now_ += 31 * kMicrosPerSecond;
    EXPECT_EQ(ledger_->get_balance("alice").available, Credits::from_whole(100));
}

// ============================================================================
// History and Audit
// ============================================================================

TEST_F(LedgerTest, ListTransactionsPagesAndFilters) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    for (int i = 0; i < 5; ++i) {
        now_ += kMicrosPerSecond;
        ledger_->debit("alice", Credits::from_whole(10), TransactionType::BET, "bet-" + std::to_string(i));
    }

    auto page = ledger_->list_transactions("alice", std::nullopt, 2, 0);
    EXPECT_EQ(page.total, 6);
    ASSERT_EQ(page.transactions.size(), 2u);
    EXPECT_EQ(page.transactions[0].reference_id, "bet-4");
    EXPECT_EQ(page.transactions[1].reference_id, "bet-3");

    auto bets = ledger_->list_transactions("alice", TransactionType::BET, 50, 4);
    EXPECT_EQ(bets.total, 5);
    ASSERT_EQ(bets.transactions.size(), 1u);
    EXPECT_EQ(bets.transactions[0].reference_id, "bet-0");

    auto clamped = ledger_->list_transactions("alice", std::nullopt, 10'000, 0);
    EXPECT_EQ(clamped.limit, 200);

    EXPECT_THROW(ledger_->list_transactions("alice", std::nullopt, 10, -1), ValidationError);
}

TEST_F(LedgerTest, ReplayMatchesStoredBalance) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    ledger_->debit("alice", Credits::from_whole(50), TransactionType::BET, "b1");
    ledger_->credit("alice", Credits::parse("95.238095"), TransactionType::PAYOUT, "b1");

    LedgerAudit audit = ledger_->verify_user("alice");
    EXPECT_TRUE(audit.consistent);
    EXPECT_EQ(audit.transaction_count, 3u);
    EXPECT_EQ(audit.replayed_balance, Credits::parse("1045.238095"));
}

TEST_F(LedgerTest, AuditFlagsTamperedBalance) {
    ledger_->open_account("alice", Credits::from_whole(1000));
    db_->set_user_balance("alice", Credits::from_whole(999));

    LedgerAudit audit = ledger_->verify_user("alice");
    EXPECT_FALSE(audit.consistent);
    EXPECT_EQ(audit.stored_balance, Credits::from_whole(999));
    EXPECT_EQ(audit.replayed_balance, Credits::from_whole(1000));
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(LedgerTest, ConcurrentDebitsNeverOverdraw) {
    ledger_->open_account("alice", Credits::from_whole(1000));

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};

    auto worker = [&]() {
        auto db = std::make_shared<Database>(test_db_path_);
        Ledger ledger(db);
        for (int i = 0; i < 10; ++i) {
            try {
                ledger.debit("alice", Credits::from_whole(60), TransactionType::BET, generate_uuid());
                succeeded++;
            } catch (const InsufficientFunds&) {
                rejected++;
            }
        }
    };

    std::thread t1(worker);
    std::thread t2(worker);
    t1.join();
    t2.join();

    EXPECT_EQ(succeeded.load(), 16);
    EXPECT_EQ(rejected.load(), 4);
    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(40));
    EXPECT_TRUE(ledger_->verify_user("alice").consistent);
}
