#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include "../core/JobScheduler.hpp"

namespace FetchCache {
    // Start/stop wrapper around one repeating sweep job.
    // The scheduler thread is created on the first Start() and lives until
    // the cleaner is destroyed.
    class PeriodicCleaner {
    public:
        using Sweep = std::function<void()>;

        PeriodicCleaner() = default;
        ~PeriodicCleaner();

        PeriodicCleaner(const PeriodicCleaner&) = delete;
        PeriodicCleaner& operator=(const PeriodicCleaner&) = delete;

        // Restarts with the new interval when already running.
        // A non-positive interval stops the cleaner.
        void Start(std::chrono::milliseconds interval, Sweep sweep);
        void Stop();
        bool IsRunning() const;
        std::chrono::milliseconds Interval() const;

    private:
        mutable std::mutex mutex_;
        std::unique_ptr<JobScheduler> scheduler_;
        std::chrono::milliseconds interval_{0};
        bool running_ = false;
    };
}
