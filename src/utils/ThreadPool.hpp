#pragma once
#include <functional>
#include <vector>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>

namespace FetchCache {
    class ThreadPool {
    public:
        explicit ThreadPool(size_t threads);
        // Drains queued tasks, then joins the workers.
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        void enqueue(std::function<void()> task);
        size_t size() const { return workers.size(); }

    private:
        void Work();

        std::vector<std::thread> workers;
        std::queue<std::function<void()>> tasks;
        std::mutex queue_mutex;
        std::condition_variable condition;
        bool stop = false;
    };
}
