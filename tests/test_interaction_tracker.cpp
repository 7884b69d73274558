#include <gtest/gtest.h>
#include "interaction/interaction_tracker.hpp"
#include "common/errors.hpp"
#include <filesystem>

using namespace thisthat;

class InteractionTrackerTest : public ::testing::Test {
protected:
    std::string test_db_path_;
    std::shared_ptr<Database> db_;
    std::unique_ptr<InteractionTracker> tracker_;
    int64_t now_{1'700'000'000'000'000};

    void SetUp() override {
        test_db_path_ = "/tmp/test_interactions_" + generate_uuid() + ".db";
        db_ = std::make_shared<Database>(test_db_path_);
        db_->initialize_schema();
        tracker_ = std::make_unique<InteractionTracker>(db_, InteractionTracker::kDefaultTtl,
                                                        [this] { return now_; });
    }

    void TearDown() override {
        tracker_.reset();
        db_.reset();
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

TEST_F(InteractionTrackerTest, SkipExpiresAfterTtl) {
    int64_t t = now_;
    auto result = tracker_->skip("alice", "m1");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.expires_at, t + 72 * kMicrosPerHour);

    now_ = t + kMicrosPerDay;
    EXPECT_EQ(tracker_->list_skipped("alice").count("m1"), 1u);

    now_ = t + 4 * kMicrosPerDay;
    EXPECT_EQ(tracker_->cleanup_expired(), 1);
    EXPECT_TRUE(tracker_->list_skipped("alice").empty());
    EXPECT_FALSE(db_->get_interaction("alice", "m1").has_value());
}

TEST_F(InteractionTrackerTest, SkipAgainRefreshesTtl) {
    int64_t t = now_;
    tracker_->skip("alice", "m1");

    now_ = t + 2 * kMicrosPerDay;
    auto refreshed = tracker_->skip("alice", "m1");
    EXPECT_EQ(refreshed.expires_at, now_ + 72 * kMicrosPerHour);

    now_ = t + 4 * kMicrosPerDay;
    EXPECT_EQ(tracker_->cleanup_expired(), 0);
    EXPECT_EQ(tracker_->list_skipped("alice").size(), 1u);
}

TEST_F(InteractionTrackerTest, ExpiredButUncleanedSkipIsHidden) {
    int64_t t = now_;
    tracker_->skip("alice", "m1");
    now_ = t + 73 * kMicrosPerHour;
    EXPECT_TRUE(tracker_->list_skipped("alice").empty());
}

TEST_F(InteractionTrackerTest, SkipsAreScopedPerUser) {
    tracker_->skip("alice", "m1");
    tracker_->skip("alice", "m2");
    tracker_->skip("bob", "m3");

    auto alice = tracker_->list_skipped("alice");
    EXPECT_EQ(alice, (std::set<std::string>{"m1", "m2"}));
    EXPECT_EQ(tracker_->list_skipped("bob").size(), 1u);
}

TEST_F(InteractionTrackerTest, RemoveSkip) {
    tracker_->skip("alice", "m1");
    EXPECT_TRUE(tracker_->remove_skip("alice", "m1"));
    EXPECT_FALSE(tracker_->remove_skip("alice", "m1"));
    EXPECT_TRUE(tracker_->list_skipped("alice").empty());
}

TEST_F(InteractionTrackerTest, RejectsEmptyIdentifiers) {
    EXPECT_THROW(tracker_->skip("", "m1"), ValidationError);
    EXPECT_THROW(tracker_->skip("alice", ""), ValidationError);
}

TEST_F(InteractionTrackerTest, CustomTtl) {
    InteractionTracker short_lived(db_, std::chrono::hours(1), [this] { return now_; });
    int64_t t = now_;
    short_lived.skip("alice", "m1");

    now_ = t + 2 * kMicrosPerHour;
    EXPECT_EQ(short_lived.cleanup_expired(), 1);
}
