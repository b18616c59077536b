#include <catch2/catch_all.hpp>
#include <atomic>
#include <sstream>
#include <thread>
#include "utils/Logger.hpp"
#include "utils/RateLimiter.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/UrlUtil.hpp"

using namespace FetchCache;

TEST_CASE("RateLimiter basic token bucket behavior") {
    RateLimiter rl(2.0); // 2 tokens per second, starts full (2)
    REQUIRE(rl.TryAcquire());
    REQUIRE(rl.TryAcquire());
    CHECK_FALSE(rl.TryAcquire()); // exhausted
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    CHECK(rl.TryAcquire()); // regained at least 1 token
}

TEST_CASE("RateLimiter burst sets the bucket capacity") {
    RateLimiter rl(1.0, 4.0);
    CHECK(rl.Available() == Catch::Approx(4.0).margin(0.01));
    for (int i = 0; i < 4; ++i) {
        REQUIRE(rl.TryAcquire());
    }
    CHECK_FALSE(rl.TryAcquire());
}

TEST_CASE("ThreadPool runs every queued task before shutting down") {
    std::atomic<int> done{0};
    {
        ThreadPool pool(4);
        CHECK(pool.size() == 4);
        for (int i = 0; i < 100; ++i) {
            pool.enqueue([&done] { ++done; });
        }
    }
    CHECK(done == 100);
}

TEST_CASE("ThreadPool survives a throwing task") {
    std::atomic<int> done{0};
    {
        ThreadPool pool(0);
        CHECK(pool.size() == 1);
        pool.enqueue([] { throw std::runtime_error("task failed"); });
        pool.enqueue([&done] { ++done; });
    }
    CHECK(done == 1);
}

TEST_CASE("Logger parses level names") {
    CHECK(Logger::FromString("debug") == LogLevel::Debug);
    CHECK(Logger::FromString("INFO") == LogLevel::Info);
    CHECK(Logger::FromString("Warning") == LogLevel::Warn);
    CHECK(Logger::FromString("err") == LogLevel::Error);
    CHECK(Logger::FromString("verbose") == LogLevel::Info);
    CHECK(std::string(Logger::ToString(LogLevel::Warn)) == "Warn");
}

TEST_CASE("Logger drops messages below the minimum level") {
    std::ostringstream out;
    auto previous = Logger::GetMinLevel();
    Logger::SetConsoleStream(&out);
    Logger::SetMinLevel(LogLevel::Warn);

    Logger::Log(LogLevel::Info, "quiet message");
    Logger::Log(LogLevel::Error, "loud message");

    Logger::SetConsoleStream(&std::clog);
    Logger::SetMinLevel(previous);

    auto text = out.str();
    CHECK(text.find("quiet message") == std::string::npos);
    CHECK(text.find("[Error] loud message") != std::string::npos);
}

TEST_CASE("UrlUtil cleans trailing punctuation and parentheses") {
    std::string text = "Check this out: (https://example.com/path). And also https://foo.bar/baz).";
    auto urls = UrlUtil::ExtractUrls(text);
    REQUIRE(urls.size() >= 2);
    CHECK(urls[0] == "https://example.com/path");
    CHECK(urls[1] == "https://foo.bar/baz");
}

TEST_CASE("NormalizeUrl produces one key per resource") {
    using UrlUtil::NormalizeUrl;

    CHECK(NormalizeUrl("HTTPS://Example.COM/Path?q=A") == "https://example.com/Path?q=A");
    CHECK(NormalizeUrl("https://example.com") == "https://example.com/");
    CHECK(NormalizeUrl("https://example.com?x=1") == "https://example.com/?x=1");
    CHECK(NormalizeUrl("https://example.com/a#section") == "https://example.com/a");
    CHECK(NormalizeUrl("not a url") == "not a url");
}
