#include "PeriodicCleaner.hpp"
#include "../utils/Logger.hpp"

namespace FetchCache {

namespace {
const char* const kSweepJobId = "cache-sweep";
}

PeriodicCleaner::~PeriodicCleaner() {
    Stop();
    // Joins the scheduler thread, waiting for a sweep that is still running.
    std::unique_ptr<JobScheduler> scheduler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler = std::move(scheduler_);
    }
}

void PeriodicCleaner::Start(std::chrono::milliseconds interval, Sweep sweep) {
    if (interval.count() <= 0) {
        Stop();
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!scheduler_) {
        scheduler_ = std::make_unique<JobScheduler>();
    }
    scheduler_->ScheduleEvery(kSweepJobId, interval, std::move(sweep));
    Logger::Log(LogLevel::Info, std::string(running_ ? "Restarted" : "Started") + " cache cleaner every " +
                                std::to_string(interval.count()) + " ms");
    interval_ = interval;
    running_ = true;
}

void PeriodicCleaner::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    scheduler_->Cancel(kSweepJobId);
    running_ = false;
    interval_ = std::chrono::milliseconds(0);
    Logger::Log(LogLevel::Info, "Stopped cache cleaner");
}

bool PeriodicCleaner::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::chrono::milliseconds PeriodicCleaner::Interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

}
