#include <catch2/catch_all.hpp>
#include <mutex>
#include <vector>
#include "TestFetchers.hpp"
#include "cache/CachedFetcher.hpp"
#include "network/HttpProducer.hpp"

using namespace FetchCache;
using namespace FetchCache::Testing;

namespace {

// Records requests; answers them immediately with `reply` unless deferred.
class FakeHttpFetcher : public IHttpFetcher {
public:
    HttpResult reply;
    bool deferred = false;

    void Fetch(const std::string& url, Callback cb) override {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.push_back(url);
        if (deferred) {
            pending_.push_back(std::move(cb));
            return;
        }
        cb(reply);
    }

    void CompleteAll() {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks.swap(pending_);
        }
        for (auto& cb : callbacks) cb(reply);
    }

    std::vector<std::string> Urls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> urls_;
    std::vector<Callback> pending_;
};

class FixedLimiter : public IRateLimiter {
public:
    explicit FixedLimiter(bool allow) : allow_(allow) {}
    bool TryAcquire() override { return allow_; }
private:
    bool allow_;
};

HttpResult Ok(const std::string& body) {
    HttpResult r;
    r.status_code = 200;
    r.content = body;
    return r;
}

}

TEST_CASE("HTTP producer resolves with the response body") {
    FakeHttpFetcher http;
    http.reply = Ok("<html>hello</html>");
    CachedFetcher<std::string> cache(MakeHttpProducer(http));

    CHECK(cache.Get("https://example.com/").get() == "<html>hello</html>");
    CHECK(cache.Get("https://example.com/").get() == "<html>hello</html>");
    REQUIRE(http.Urls().size() == 1);
    CHECK(http.Urls()[0] == "https://example.com/");
}

TEST_CASE("HTTP producer requests the URL passed in params") {
    FakeHttpFetcher http;
    http.reply = Ok("body");
    CachedFetcher<std::string> cache(MakeHttpProducer(http));

    FetchOptions<std::string> options;
    options.params = std::string("HTTPS://Example.com/page#top");
    CHECK(cache.Get("https://example.com/page", options).get() == "body");
    REQUIRE(http.Urls().size() == 1);
    CHECK(http.Urls()[0] == "HTTPS://Example.com/page#top");
}

TEST_CASE("HTTP error statuses reject the fetch") {
    FakeHttpFetcher http;
    http.reply.status_code = 404;
    CachedFetcher<std::string> cache(MakeHttpProducer(http));

    auto result = cache.Get("https://example.com/missing");
    try {
        result.get();
        FAIL("expected HttpError");
    } catch (const HttpError& e) {
        CHECK(e.status_code() == 404);
        CHECK(e.url() == "https://example.com/missing");
        CHECK(std::string(e.what()) == "HTTP 404 from https://example.com/missing");
    }
    CHECK(cache.Size() == 0);
}

TEST_CASE("Transport failures reject with status 0") {
    FakeHttpFetcher http;
    http.reply.error = "Couldn't resolve host name";
    CachedFetcher<std::string> cache(MakeHttpProducer(http));

    auto result = cache.Get("https://nowhere.invalid/");
    try {
        result.get();
        FAIL("expected HttpError");
    } catch (const HttpError& e) {
        CHECK(e.status_code() == 0);
        CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("Couldn't resolve host name"));
    }
}

TEST_CASE("Rate limited fetches are rejected and not cached") {
    FakeHttpFetcher http;
    http.reply = Ok("body");
    FixedLimiter deny(false);
    CachedFetcher<std::string> cache(MakeHttpProducer(http, &deny));

    CHECK_THROWS_AS(cache.Get("https://example.com/").get(), RateLimitedError);
    CHECK(http.Urls().empty());
    CHECK(cache.Size() == 0);
}

TEST_CASE("Truncated bodies are still delivered") {
    FakeHttpFetcher http;
    http.reply = Ok("partial");
    http.reply.truncated = true;
    CachedFetcher<std::string> cache(MakeHttpProducer(http));

    CHECK(cache.Get("https://example.com/big").get() == "partial");
}

TEST_CASE("Concurrent requests for one URL share a single HTTP request") {
    FakeHttpFetcher http;
    http.reply = Ok("shared");
    http.deferred = true;
    CachedFetcher<std::string> cache(MakeHttpProducer(http));

    auto a = cache.Get("https://example.com/");
    auto b = cache.Get("https://example.com/");
    auto c = cache.Get("https://example.com/");
    CHECK_FALSE(IsReady(a));
    CHECK(http.Urls().size() == 1);

    http.CompleteAll();
    CHECK(a.get() == "shared");
    CHECK(b.get() == "shared");
    CHECK(c.get() == "shared");
}
