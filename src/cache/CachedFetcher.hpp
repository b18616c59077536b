#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "CacheEntry.hpp"
#include "CacheErrors.hpp"
#include "FetchCompletion.hpp"
#include "FetchOptions.hpp"
#include "PeriodicCleaner.hpp"
#include "../interfaces/IFetchCache.hpp"
#include "../utils/Logger.hpp"

namespace FetchCache {

// Memoizes an asynchronous producer per key.
//
// Concurrent Get() calls for a key share one producer invocation: whoever
// arrives while a fetch is outstanding joins it and receives the same value
// or the same exception. Committed results live for the configured TTL. With
// double buffering an expired value is still served immediately while one
// background fetch replaces it.
//
// All map and entry state sits behind one mutex. Producers are always called
// with that mutex released and may settle their completion from any thread.
template<typename T>
class CachedFetcher : public IFetchCache<T> {
public:
    using Clock = typename CacheEntry<T>::Clock;

    explicit CachedFetcher(CacheConfig<T> config);
    explicit CachedFetcher(Fetcher<T> fetcher);
    ~CachedFetcher() override;

    CachedFetcher(const CachedFetcher&) = delete;
    CachedFetcher& operator=(const CachedFetcher&) = delete;

    std::future<T> Get(const std::string& key, const FetchOptions<T>& options = {}) override;
    void Invalidate(const std::string& key) override;
    void InvalidateAll() override;
    void Clean() override;
    size_t Size() const override;

    // Without an interval (or with a non-positive one) the configured
    // clean_interval is used; if that is 0 too the cleaner is stopped.
    void StartCleaner(std::optional<std::chrono::milliseconds> interval = std::nullopt);
    void StopCleaner();
    bool IsCleanerRunning() const;

private:
    using EntryPtr = std::shared_ptr<CacheEntry<T>>;

    // Shared with in-flight completions so a fetch can still commit after the
    // cache object itself is gone.
    struct State {
        explicit State(CacheConfig<T> c) : config(std::move(c)) {}

        const CacheConfig<T> config;
        std::unordered_map<std::string, EntryPtr> entries;
        mutable std::mutex mutex;
    };

    void Launch(const std::string& key, const EntryPtr& entry, const FetchOptions<T>& options, Fetcher<T> fetcher);
    static void Commit(const std::shared_ptr<State>& state, const std::string& key, const EntryPtr& entry,
                       std::optional<std::chrono::milliseconds> ttl, std::optional<T> value, std::exception_ptr error);

    std::shared_ptr<State> state_;
    PeriodicCleaner cleaner_;
};

template<typename T>
CachedFetcher<T>::CachedFetcher(CacheConfig<T> config)
    : state_(std::make_shared<State>(std::move(config))) {
    if (state_->config.clean_interval.count() > 0) {
        StartCleaner();
    }
}

template<typename T>
CachedFetcher<T>::CachedFetcher(Fetcher<T> fetcher)
    : CachedFetcher(CacheConfig<T>{std::chrono::milliseconds(60000), std::chrono::milliseconds(0), false, false, std::move(fetcher)}) {}

template<typename T>
CachedFetcher<T>::~CachedFetcher() {
    StopCleaner();
}

template<typename T>
std::future<T> CachedFetcher<T>::Get(const std::string& key, const FetchOptions<T>& options) {
    EntryPtr launched;
    Fetcher<T> fetcher;
    std::future<T> result;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const auto now = Clock::now();
        const bool double_buffer = options.double_buffer.value_or(state_->config.double_buffer);

        auto it = state_->entries.find(key);
        if (it != state_->entries.end()) {
            const EntryPtr& cached = it->second;

            // 1. Join the outstanding fetch
            if (cached->is_fetching) {
                cached->waiters.emplace_back();
                return cached->waiters.back().get_future();
            }

            // 2. Committed and not expired
            if (cached->IsFresh(now)) {
                return cached->Settled();
            }

            // 3. Expired, but a background refresh is already running
            if (cached->refresh) {
                if (double_buffer) {
                    return cached->Settled();
                }
                cached->refresh->waiters.emplace_back();
                return cached->refresh->waiters.back().get_future();
            }

            // 4. Expired result (value or cached error) served as-is while one refresh runs detached
            if (double_buffer) {
                fetcher = options.fetcher ? options.fetcher : state_->config.fetcher;
                if (fetcher) {
                    launched = std::make_shared<CacheEntry<T>>();
                    launched->is_fetching = true;
                    cached->refresh = launched;
                    Logger::Log(LogLevel::Debug, "Serving stale result while refreshing key: " + key);
                } else {
                    Logger::Log(LogLevel::Warn, "No fetcher to refresh stale key: " + key);
                }
                result = cached->Settled();
            }
        }

        // 5. Start a new fetch that later callers can join
        if (!result.valid()) {
            fetcher = options.fetcher ? options.fetcher : state_->config.fetcher;
            if (!fetcher) {
                Logger::Log(LogLevel::Warn, "Get called without a fetcher for key: " + key);
                std::promise<T> missing;
                missing.set_exception(std::make_exception_ptr(MissingFetcherError(key)));
                return missing.get_future();
            }
            launched = std::make_shared<CacheEntry<T>>();
            launched->is_fetching = true;
            launched->waiters.emplace_back();
            result = launched->waiters.back().get_future();
            state_->entries[key] = launched;
        }
    }

    if (launched) {
        Launch(key, launched, options, std::move(fetcher));
    }
    return result;
}

template<typename T>
void CachedFetcher<T>::Launch(const std::string& key, const EntryPtr& entry, const FetchOptions<T>& options, Fetcher<T> fetcher) {
    std::shared_ptr<State> state = state_;
    std::optional<std::chrono::milliseconds> ttl = options.ttl;
    FetchCompletion<T> done([state, key, entry, ttl](std::optional<T> value, std::exception_ptr error) {
        Commit(state, key, entry, ttl, std::move(value), std::move(error));
    });

    Logger::Log(LogLevel::Debug, "Fetching key: " + key);
    try {
        fetcher(key, options.params, *this, done);
    } catch (...) {
        // A producer that throws instead of rejecting still fails the fetch
        done.Reject(std::current_exception());
    }
}

template<typename T>
void CachedFetcher<T>::Commit(const std::shared_ptr<State>& state, const std::string& key, const EntryPtr& entry,
                              std::optional<std::chrono::milliseconds> ttl, std::optional<T> value, std::exception_ptr error) {
    std::vector<std::promise<T>> waiters;
    bool failed = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (value) {
            entry->value = std::move(value);
            entry->has_error = false;
            entry->error = nullptr;
        } else {
            entry->value.reset();
            entry->has_error = true;
            entry->error = error;
        }
        failed = entry->has_error;
        waiters.swap(entry->waiters);
        entry->is_fetching = false;

        auto it = state->entries.find(key);
        const bool owns_slot = it != state->entries.end() &&
                               (it->second == entry || it->second->refresh == entry);

        if (!failed || state->config.cache_errors) {
            const auto effective_ttl = ttl.value_or(state->config.default_ttl);
            if (effective_ttl.count() > 0) {
                entry->expire_at = Clock::now() + effective_ttl;
            }
            if (it == state->entries.end()) {
                state->entries.emplace(key, entry);
            } else if (owns_slot || !it->second->is_fetching) {
                it->second = entry;
            }
            // Otherwise the key was invalidated and is being fetched again; that fetch keeps the slot.
        } else if (owns_slot) {
            state->entries.erase(it);
        }
    }

    if (failed) {
        Logger::Log(LogLevel::Warn, "Fetch failed for key: " + key +
                                    (state->config.cache_errors ? " (error cached)" : ""));
        for (auto& waiter : waiters) {
            waiter.set_exception(error);
        }
    } else {
        // The committed value is never modified again, so it is safe to read unlocked.
        for (auto& waiter : waiters) {
            waiter.set_value(*entry->value);
        }
    }
}

template<typename T>
void CachedFetcher<T>::Invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->entries.erase(key);
}

template<typename T>
void CachedFetcher<T>::InvalidateAll() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->entries.clear();
}

template<typename T>
void CachedFetcher<T>::Clean() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const auto now = Clock::now();
        for (auto it = state_->entries.begin(); it != state_->entries.end();) {
            // Stale entries being refreshed stay until the refresh commits
            if (it->second->IsExpired(now) && !it->second->refresh) {
                it = state_->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        Logger::Log(LogLevel::Debug, "Removed " + std::to_string(removed) + " expired cache entries");
    }
}

template<typename T>
size_t CachedFetcher<T>::Size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

template<typename T>
void CachedFetcher<T>::StartCleaner(std::optional<std::chrono::milliseconds> interval) {
    auto effective = (interval && interval->count() > 0) ? *interval : state_->config.clean_interval;
    cleaner_.Start(effective, [this] { Clean(); });
}

template<typename T>
void CachedFetcher<T>::StopCleaner() {
    cleaner_.Stop();
}

template<typename T>
bool CachedFetcher<T>::IsCleanerRunning() const {
    return cleaner_.IsRunning();
}

}
