#include "jobs/periodic_job.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace thisthat {

namespace {

// Clears the in-flight flag however the cycle ends
class CycleGuard {
public:
    explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~CycleGuard() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

} // namespace

PeriodicJob::PeriodicJob(std::string name, std::chrono::milliseconds interval, Task task)
    : name_(std::move(name))
    , interval_(interval)
    , task_(std::move(task))
{
    if (!task_) {
        throw std::invalid_argument("PeriodicJob " + name_ + " requires a task");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("PeriodicJob " + name_ + " requires a positive interval");
    }
}

PeriodicJob::~PeriodicJob() {
    stop();
}

void PeriodicJob::start() {
    if (running_) return;

    running_ = true;
    worker_ = std::thread(&PeriodicJob::loop, this);
    spdlog::info("Job {} started (every {}ms)", name_, interval_.count());
}

void PeriodicJob::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Job {} stopped after {} runs ({} failed, {} skipped)",
                 name_, runs_.load(), failures_.load(), skipped_.load());
}

bool PeriodicJob::trigger() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        skipped_++;
        spdlog::debug("Job {} cycle skipped, previous cycle still running", name_);
        return false;
    }

    CycleGuard guard(in_flight_);
    runs_++;
    try {
        task_();
    } catch (const std::exception& e) {
        failures_++;
        spdlog::error("Job {} cycle failed: {}", name_, e.what());
    } catch (...) {
        failures_++;
        spdlog::error("Job {} cycle failed with a non-standard exception", name_);
    }
    return true;
}

void PeriodicJob::loop() {
    trigger();

    while (running_) {
        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
        lock.unlock();

        if (!running_) break;
        trigger();
    }
}

} // namespace thisthat
