#include "JobScheduler.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <exception>

namespace FetchCache {

JobScheduler::JobScheduler() : stop_(false) {
    scheduler_thread = std::thread(&JobScheduler::Run, this);
}

JobScheduler::~JobScheduler() {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        stop_ = true;
    }
    cv.notify_all();
    if (scheduler_thread.joinable()) {
        scheduler_thread.join();
    }
}

void JobScheduler::Run() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    while (!stop_) {
        if (jobs.empty()) {
            cv.wait(lock, [this] { return stop_ || !jobs.empty(); });
            continue;
        }

        auto next = std::min_element(jobs.begin(), jobs.end(), [](const ScheduledJob& a, const ScheduledJob& b) {
            return a.execution_time < b.execution_time;
        });

        auto now = std::chrono::steady_clock::now();
        if (next->execution_time > now) {
            // Copy the deadline: Schedule() may reallocate the vector while we wait.
            auto wake_at = next->execution_time;
            cv.wait_until(lock, wake_at);
            continue;
        }

        ScheduledJob due = std::move(*next);
        jobs.erase(next);

        // Unlock before executing so the job and other threads can Cancel/Schedule
        lock.unlock();
        try {
            due.job();
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Scheduled job '" + due.id + "' failed: " + e.what());
        }
        lock.lock();

        if (!stop_ && due.interval.count() > 0 && generations_[due.id] == due.generation) {
            due.execution_time = std::chrono::steady_clock::now() + due.interval;
            jobs.push_back(std::move(due));
        }
    }
}

void JobScheduler::Enqueue(const JobId& id, std::chrono::milliseconds delay, std::chrono::milliseconds interval, Job job) {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);

        auto it = std::find_if(jobs.begin(), jobs.end(), [&id](const ScheduledJob& j) {
            return j.id == id;
        });
        if (it != jobs.end()) {
            jobs.erase(it);
            Logger::Log(LogLevel::Debug, "Replacing scheduled job: " + id);
        }

        // Bumping the generation also stops a running repeat of this id from re-arming.
        uint64_t generation = ++generations_[id];
        jobs.push_back({
            id,
            std::chrono::steady_clock::now() + delay,
            interval,
            std::move(job),
            generation
        });
    }
    cv.notify_one();
}

void JobScheduler::Schedule(const JobId& id, std::chrono::milliseconds delay, Job job) {
    Enqueue(id, delay, std::chrono::milliseconds(0), std::move(job));
}

void JobScheduler::ScheduleEvery(const JobId& id, std::chrono::milliseconds interval, Job job) {
    Enqueue(id, interval, interval, std::move(job));
}

void JobScheduler::Cancel(const JobId& id) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    ++generations_[id];
    auto removed = std::remove_if(jobs.begin(), jobs.end(), [&id](const ScheduledJob& j) {
        return j.id == id;
    });
    if (removed != jobs.end()) {
        jobs.erase(removed, jobs.end());
        Logger::Log(LogLevel::Debug, "Cancelled scheduled job: " + id);
    }
    cv.notify_all();
}

bool JobScheduler::IsScheduled(const JobId& id) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    return std::any_of(jobs.begin(), jobs.end(), [&id](const ScheduledJob& j) {
        return j.id == id;
    });
}

}
