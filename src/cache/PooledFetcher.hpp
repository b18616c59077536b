#pragma once
#include <any>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include "FetchOptions.hpp"
#include "../utils/ThreadPool.hpp"

namespace FetchCache {

template<typename T>
using BlockingLoader = std::function<T(const std::string& key, const std::any& params)>;

// Adapts a synchronous loader into a Fetcher that runs on `pool`.
// Whatever the loader throws becomes the rejection of the fetch.
// The pool must outlive every fetch started through the returned fetcher.
template<typename T>
Fetcher<T> MakePooledFetcher(ThreadPool& pool, BlockingLoader<T> loader) {
    return [&pool, loader = std::move(loader)](const std::string& key, const std::any& params,
                                               IFetchCache<T>&, FetchCompletion<T> done) {
        pool.enqueue([loader, key, params, done]() {
            try {
                done.Resolve(loader(key, params));
            } catch (...) {
                done.Reject(std::current_exception());
            }
        });
    };
}

}
