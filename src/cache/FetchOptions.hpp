#pragma once
#include <any>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "FetchCompletion.hpp"

namespace FetchCache {

template<typename T>
class IFetchCache;

// Producer contract. The fetcher must eventually settle `done`, on any thread.
// `cache` may be used to Get() other keys; calling Get() for the key being
// fetched from inside its own fetch is not allowed (it would join itself).
template<typename T>
using Fetcher = std::function<void(const std::string& key, const std::any& params,
                                   IFetchCache<T>& cache, FetchCompletion<T> done)>;

template<typename T>
struct FetchOptions {
    std::optional<std::chrono::milliseconds> ttl;   // overrides CacheConfig::default_ttl
    std::optional<bool> double_buffer;              // overrides CacheConfig::double_buffer
    std::any params;                                // handed to the fetcher untouched
    Fetcher<T> fetcher;                             // overrides CacheConfig::fetcher
};

template<typename T>
struct CacheConfig {
    std::chrono::milliseconds default_ttl{60000};   // <= 0 never expires
    std::chrono::milliseconds clean_interval{0};    // 0 disables the periodic sweep
    bool cache_errors = false;
    bool double_buffer = false;
    Fetcher<T> fetcher;
};

}
