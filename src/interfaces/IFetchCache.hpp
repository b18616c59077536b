#pragma once
#include <cstddef>
#include <future>
#include <string>
#include "../cache/FetchOptions.hpp"

namespace FetchCache {

template<typename T>
class IFetchCache {
public:
    virtual ~IFetchCache() = default;
    virtual std::future<T> Get(const std::string& key, const FetchOptions<T>& options = {}) = 0;
    virtual void Invalidate(const std::string& key) = 0;
    virtual void InvalidateAll() = 0;
    virtual void Clean() = 0;
    virtual size_t Size() const = 0;
};

}
