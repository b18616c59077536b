#pragma once
#include <string>
#include <functional>

namespace FetchCache {

struct HttpResult {
    std::string content;
    long status_code = 0;
    std::string error;          // transport error; empty when a response was received
    std::string effective_url;
    bool truncated = false;
};

class IHttpFetcher {
public:
    using Callback = std::function<void(HttpResult)>;
    virtual ~IHttpFetcher() = default;
    // The callback runs exactly once, on the fetcher's own thread.
    virtual void Fetch(const std::string& url, Callback cb) = 0;
};

}
