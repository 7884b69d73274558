#include <gtest/gtest.h>
#include "economy/credit_purchases.hpp"
#include "common/errors.hpp"
#include <filesystem>

using namespace thisthat;

TEST(CreditPackageTest, CatalogMatchesPackages) {
    ASSERT_EQ(credit_packages().size(), 4u);
    EXPECT_EQ(find_credit_package("starter")->credits, Credits::from_whole(500));
    EXPECT_EQ(find_credit_package("boost")->credits, Credits::from_whole(1000));
    EXPECT_EQ(find_credit_package("pro")->credits, Credits::from_whole(2500));
    EXPECT_EQ(find_credit_package("whale")->credits, Credits::from_whole(5000));
    EXPECT_EQ(find_credit_package("whale")->usd, Decimal::parse("34.99"));
    EXPECT_FALSE(find_credit_package("mega").has_value());
}

class CreditPurchasesTest : public ::testing::Test {
protected:
    std::string test_db_path_;
    std::shared_ptr<Database> db_;
    std::shared_ptr<Ledger> ledger_;
    std::unique_ptr<CreditPurchases> purchases_;
    int64_t now_{1'700'000'000'000'000};

    void SetUp() override {
        test_db_path_ = "/tmp/test_purchases_" + generate_uuid() + ".db";
        db_ = std::make_shared<Database>(test_db_path_);
        db_->initialize_schema();
        ledger_ = std::make_shared<Ledger>(db_, [this] { return now_; });
        purchases_ = std::make_unique<CreditPurchases>(ledger_);
        ledger_->open_account("alice", Credits::from_whole(1000));
    }

    void TearDown() override {
        purchases_.reset();
        ledger_.reset();
        db_.reset();
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

TEST_F(CreditPurchasesTest, PurchaseGrantsPackageCredits) {
    auto result = purchases_->purchase(PurchaseRequest{"alice", "starter"});

    EXPECT_FALSE(result.duplicate);
    EXPECT_EQ(result.new_balance, Credits::from_whole(1500));
    EXPECT_EQ(result.purchase.credits_granted, Credits::from_whole(500));
    EXPECT_EQ(result.purchase.usd_amount, Decimal::parse("4.99"));
    EXPECT_EQ(result.purchase.status, "completed");
    EXPECT_EQ(result.purchase.provider, "manual");

    auto page = ledger_->list_transactions("alice", TransactionType::CREDIT_PURCHASE);
    ASSERT_EQ(page.total, 1);
    EXPECT_EQ(page.transactions[0].reference_id, result.purchase.id);
    EXPECT_EQ(page.transactions[0].balance_after, Credits::from_whole(1500));
    EXPECT_TRUE(ledger_->verify_user("alice").consistent);
}

TEST_F(CreditPurchasesTest, InvalidPackageLeavesNoTrace) {
    EXPECT_THROW(purchases_->purchase(PurchaseRequest{"alice", "mega"}), ValidationError);

    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(1000));
    EXPECT_TRUE(purchases_->list_purchases("alice").empty());
}

TEST_F(CreditPurchasesTest, UnknownUserIsNotFound) {
    EXPECT_THROW(purchases_->purchase(PurchaseRequest{"ghost", "pro"}), NotFound);
    EXPECT_THROW(purchases_->list_purchases("ghost"), NotFound);
}

TEST_F(CreditPurchasesTest, ReplayedProviderReferenceGrantsOnce) {
    PurchaseRequest request{"alice", "boost", "stripe", std::string("pi_123")};

    auto first = purchases_->purchase(request);
    auto second = purchases_->purchase(request);

    EXPECT_FALSE(first.duplicate);
    EXPECT_TRUE(second.duplicate);
    EXPECT_EQ(first.purchase.id, second.purchase.id);
    EXPECT_EQ(second.new_balance, Credits::from_whole(2000));
    EXPECT_EQ(ledger_->list_transactions("alice", TransactionType::CREDIT_PURCHASE).total, 1);
}

TEST_F(CreditPurchasesTest, HistoryNewestFirst) {
    purchases_->purchase(PurchaseRequest{"alice", "starter"});
    now_ += kMicrosPerSecond;
    purchases_->purchase(PurchaseRequest{"alice", "whale"});

    auto history = purchases_->list_purchases("alice");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].package_id, "whale");
    EXPECT_EQ(history[1].package_id, "starter");
    EXPECT_EQ(ledger_->get_balance("alice").balance, Credits::from_whole(6500));
}
