#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace FetchCache {

// Per-key state. Only touched while the owning cache's mutex is held.
template<typename T>
struct CacheEntry {
    using Clock = std::chrono::steady_clock;

    std::optional<T> value;
    bool has_error = false;
    std::exception_ptr error;
    std::optional<Clock::time_point> expire_at;    // unset: never expires on its own
    bool is_fetching = false;
    std::vector<std::promise<T>> waiters;          // non-empty only while is_fetching
    std::shared_ptr<CacheEntry> refresh;           // detached entry of a stale-while-revalidate fetch

    bool IsFresh(Clock::time_point now) const {
        return !expire_at || now <= *expire_at;
    }

    bool IsExpired(Clock::time_point now) const {
        return expire_at && *expire_at < now;
    }

    // Immediately-ready future carrying the committed outcome.
    std::future<T> Settled() const {
        std::promise<T> promise;
        if (has_error) {
            promise.set_exception(error);
        } else {
            promise.set_value(*value);
        }
        return promise.get_future();
    }
};

}
