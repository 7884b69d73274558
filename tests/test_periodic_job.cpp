#include <gtest/gtest.h>
#include "jobs/periodic_job.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace thisthat;

TEST(PeriodicJobTest, RunsImmediatelyOnStart) {
    std::atomic<int> runs{0};
    PeriodicJob job("test", std::chrono::hours(1), [&] { runs++; });

    job.start();
    EXPECT_TRUE(job.is_running());
    for (int i = 0; i < 100 && runs.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    job.stop();

    EXPECT_FALSE(job.is_running());
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(job.runs(), 1);
}

TEST(PeriodicJobTest, RepeatsAtInterval) {
    std::atomic<int> runs{0};
    PeriodicJob job("fast", std::chrono::milliseconds(10), [&] { runs++; });

    job.start();
    for (int i = 0; i < 200 && runs.load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    job.stop();

    EXPECT_GE(runs.load(), 3);
}

TEST(PeriodicJobTest, StopWakesSleepingWorker) {
    PeriodicJob job("idle", std::chrono::hours(1), [] {});
    job.start();

    auto begin = std::chrono::steady_clock::now();
    job.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));

    // Second stop is harmless
    job.stop();
}

TEST(PeriodicJobTest, FailuresAreCountedAndScheduleContinues) {
    PeriodicJob job("failing", std::chrono::hours(1), [] {
        throw std::runtime_error("boom");
    });

    EXPECT_TRUE(job.trigger());
    EXPECT_TRUE(job.trigger());
    EXPECT_EQ(job.runs(), 2);
    EXPECT_EQ(job.failures(), 2);
}

TEST(PeriodicJobTest, NonStandardThrowCountedAndFlagCleared) {
    int calls = 0;
    PeriodicJob job("odd", std::chrono::hours(1), [&] {
        if (++calls == 1) {
            throw 42;
        }
    });

    EXPECT_NO_THROW(job.trigger());
    EXPECT_EQ(job.failures(), 1);

    // A later cycle is not mistaken for an overlapping one
    EXPECT_TRUE(job.trigger());
    EXPECT_EQ(job.runs(), 2);
    EXPECT_EQ(job.skipped(), 0);
    EXPECT_EQ(job.failures(), 1);
}

TEST(PeriodicJobTest, OverlappingTriggerIsSkipped) {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};

    PeriodicJob job("slow", std::chrono::hours(1), [&] {
        entered = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    std::thread first([&] { job.trigger(); });
    while (!entered) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_FALSE(job.trigger());
    EXPECT_EQ(job.skipped(), 1);

    release = true;
    first.join();
    EXPECT_EQ(job.runs(), 1);
}

TEST(PeriodicJobTest, RejectsBadArguments) {
    EXPECT_THROW(PeriodicJob("x", std::chrono::milliseconds(0), [] {}), std::invalid_argument);
    EXPECT_THROW(PeriodicJob("x", std::chrono::milliseconds(10), PeriodicJob::Task{}),
                 std::invalid_argument);
}
