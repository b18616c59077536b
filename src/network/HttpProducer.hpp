#pragma once
#include <stdexcept>
#include <string>
#include "../cache/FetchOptions.hpp"
#include "../interfaces/IHttpFetcher.hpp"
#include "../interfaces/IRateLimiter.hpp"

namespace FetchCache {

// Transport failure (status_code 0) or an HTTP status of 400 and above.
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& url, long status_code, const std::string& message);
    const std::string& url() const { return url_; }
    long status_code() const { return status_code_; }

private:
    std::string url_;
    long status_code_;
};

class RateLimitedError : public std::runtime_error {
public:
    explicit RateLimitedError(const std::string& url);
};

// Fetcher that GETs a URL and yields the response body.
// The URL is taken from params when it holds a std::string, otherwise the
// cache key is the URL. `limiter` may be null.
Fetcher<std::string> MakeHttpProducer(IHttpFetcher& http, IRateLimiter* limiter = nullptr);

}
