#pragma once
#include <functional>
#include <vector>
#include <unordered_map>
#include <string>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace FetchCache {
    // Runs delayed and repeating jobs on a single background thread.
    // A repeating job is re-armed only after its previous run returned, so a
    // job never overlaps with itself.
    class JobScheduler {
    public:
        using Job = std::function<void()>;
        using JobId = std::string;

        JobScheduler();
        ~JobScheduler();

        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

        // Scheduling an id that is already pending replaces it.
        void Schedule(const JobId& id, std::chrono::milliseconds delay, Job job);
        void ScheduleEvery(const JobId& id, std::chrono::milliseconds interval, Job job);
        void Cancel(const JobId& id);
        bool IsScheduled(const JobId& id);

    private:
        void Run();
        void Enqueue(const JobId& id, std::chrono::milliseconds delay, std::chrono::milliseconds interval, Job job);

        struct ScheduledJob {
            JobId id;
            std::chrono::steady_clock::time_point execution_time;
            std::chrono::milliseconds interval{0};
            Job job;
            uint64_t generation = 0;
        };

        std::vector<ScheduledJob> jobs;
        std::unordered_map<JobId, uint64_t> generations_;
        std::mutex jobs_mutex;
        std::condition_variable cv;
        std::thread scheduler_thread;
        bool stop_ = false;
    };
}
