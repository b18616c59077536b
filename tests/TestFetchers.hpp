#pragma once
#include <any>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "cache/CachedFetcher.hpp"

namespace FetchCache {
namespace Testing {

template<typename T>
bool IsReady(const std::future<T>& f) {
    return f.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

// Records every invocation; the test decides when and how each fetch settles.
template<typename T>
class ManualFetcher {
public:
    struct Call {
        std::string key;
        std::any params;
        IFetchCache<T>* cache;
        FetchCompletion<T> done;
    };

    Fetcher<T> AsFetcher() {
        return [this](const std::string& key, const std::any& params, IFetchCache<T>& cache, FetchCompletion<T> done) {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({key, params, &cache, done});
        };
    }

    size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    Call At(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.at(index);
    }

    bool Resolve(size_t index, T value) const { return At(index).done.Resolve(std::move(value)); }

    bool Reject(size_t index, const std::string& message) const {
        return At(index).done.Fail(std::runtime_error(message));
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

// Settles synchronously: "<prefix><n>" for the n-th call, or a failure when `fail` is set.
class CountingFetcher {
public:
    explicit CountingFetcher(std::string prefix = "v", bool fail = false)
        : prefix_(std::move(prefix)), fail_(fail) {}

    Fetcher<std::string> AsFetcher() {
        return [this](const std::string&, const std::any&, IFetchCache<std::string>&, FetchCompletion<std::string> done) {
            int n = ++calls_;
            if (fail_) {
                done.Fail(std::runtime_error("fetch " + std::to_string(n) + " failed"));
            } else {
                done.Resolve(prefix_ + std::to_string(n));
            }
        };
    }

    int CallCount() const { return calls_.load(); }

private:
    std::string prefix_;
    bool fail_;
    std::atomic<int> calls_{0};
};

}
}
