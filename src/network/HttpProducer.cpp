#include "HttpProducer.hpp"
#include "../utils/Logger.hpp"

namespace FetchCache {

HttpError::HttpError(const std::string& url, long status_code, const std::string& message)
    : std::runtime_error(message), url_(url), status_code_(status_code) {}

RateLimitedError::RateLimitedError(const std::string& url)
    : std::runtime_error("Rate limit exceeded for URL: " + url) {}

Fetcher<std::string> MakeHttpProducer(IHttpFetcher& http, IRateLimiter* limiter) {
    return [&http, limiter](const std::string& key, const std::any& params,
                            IFetchCache<std::string>&, FetchCompletion<std::string> done) {
        const auto* override_url = std::any_cast<std::string>(&params);
        std::string url = override_url ? *override_url : key;

        if (limiter && !limiter->TryAcquire()) {
            Logger::Log(LogLevel::Warn, "Rate limit exceeded. Rejecting fetch for URL: " + url);
            done.Fail(RateLimitedError(url));
            return;
        }

        http.Fetch(url, [url, done](HttpResult result) {
            if (!result.error.empty()) {
                done.Fail(HttpError(url, 0, "Failed to fetch " + url + ": " + result.error));
                return;
            }
            if (result.status_code >= 400) {
                done.Fail(HttpError(url, result.status_code,
                                    "HTTP " + std::to_string(result.status_code) + " from " + url));
                return;
            }
            if (result.truncated) {
                Logger::Log(LogLevel::Warn, "Response body truncated for URL: " + url);
            }
            done.Resolve(std::move(result.content));
        });
    };
}

}
