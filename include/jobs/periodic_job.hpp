#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace thisthat {

/**
 * Runs a task now and then every interval on a worker thread.
 *
 * Cycles never overlap: a trigger() that finds a cycle in flight is skipped,
 * not queued. Exceptions from the task are logged and the cycle counted as
 * failed; the schedule continues.
 */
class PeriodicJob {
public:
    using Task = std::function<void()>;

    PeriodicJob(std::string name, std::chrono::milliseconds interval, Task task);
    ~PeriodicJob();

    PeriodicJob(const PeriodicJob&) = delete;
    PeriodicJob& operator=(const PeriodicJob&) = delete;

    void start();
    // Wakes the worker, lets an in-flight cycle finish, then joins.
    void stop();
    bool is_running() const { return running_.load(); }

    // Runs one cycle on the caller's thread. Returns false if skipped
    // because another cycle was in flight.
    bool trigger();

    const std::string& name() const { return name_; }
    int64_t runs() const { return runs_.load(); }
    int64_t failures() const { return failures_.load(); }
    int64_t skipped() const { return skipped_.load(); }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Task task_;

    std::atomic<bool> running_{false};
    std::atomic<bool> in_flight_{false};
    std::atomic<int64_t> runs_{0};
    std::atomic<int64_t> failures_{0};
    std::atomic<int64_t> skipped_{0};

    std::thread worker_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    void loop();
};

} // namespace thisthat
