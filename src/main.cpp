#include <iostream>
#include <string>
#include <chrono>
#include <vector>
#include <future>
#include <curl/curl.h>
#include <filesystem>
#include "../config/Config.hpp"
#include "cache/CachedFetcher.hpp"
#include "network/HttpFetcher.hpp"
#include "network/HttpProducer.hpp"
#include "utils/Logger.hpp"
#include "utils/RateLimiter.hpp"
#include "utils/UrlUtil.hpp"

namespace {

void PrintHelp() {
    std::cout << "Enter text containing URLs to fetch them through the cache, or a command:\n"
                 "  :invalidate <url>  drop one cached URL\n"
                 "  :clear             drop every cached URL\n"
                 "  :clean             sweep expired entries now\n"
                 "  :size              number of cached entries\n"
                 "  :quit              exit\n";
}

struct PendingFetch {
    std::string url;
    std::chrono::steady_clock::time_point started;
    std::future<std::string> result;
};

PendingFetch StartFetch(FetchCache::CachedFetcher<std::string>& cache, const std::string& url) {
    FetchCache::FetchOptions<std::string> options;
    options.params = url;
    return {url, std::chrono::steady_clock::now(), cache.Get(FetchCache::UrlUtil::NormalizeUrl(url), options)};
}

void Report(PendingFetch& pending) {
    try {
        std::string body = pending.result.get();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - pending.started);
        std::cout << pending.url << " " << body.size() << " bytes " << elapsed.count() << " ms" << std::endl;
    } catch (const std::exception& e) {
        std::cout << pending.url << " failed: " << e.what() << std::endl;
    }
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        FetchCache::Logger::Log(FetchCache::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1]) : exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    // Load Config
    auto& config = FetchCache::Config::GetInstance();
    try {
        config.Load(config_path_str);
        FetchCache::Logger::Log(FetchCache::LogLevel::Info, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            FetchCache::Logger::Log(FetchCache::LogLevel::Error, "Failed to load config: " + error_message);
            return 1;
        }
        FetchCache::Logger::Log(FetchCache::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
        try {
            config.CreateDefault(config_path_str);
            FetchCache::Logger::Log(FetchCache::LogLevel::Info, "Default config.json created. Review it and restart.");
            return 0;
        } catch (const std::exception& create_e) {
            FetchCache::Logger::Log(FetchCache::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
            return 1;
        }
    } catch (const std::exception& e) {
        FetchCache::Logger::Log(FetchCache::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return 1;
    }

    if (!config.log_dir.empty()) {
        FetchCache::Logger::Init(config.log_dir, FetchCache::Logger::FromString(config.log_level));
    } else {
        FetchCache::Logger::SetMinLevel(FetchCache::Logger::FromString(config.log_level));
    }

    // Initialize global resources
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        FetchCache::Logger::Log(FetchCache::LogLevel::Error, "curl_global_init failed");
        return 1;
    }

    int exit_code = 0;
    try {
        // Setup Core Components
        FetchCache::HttpFetcher http_fetcher(config);
        FetchCache::RateLimiter rate_limiter(config.rate_per_sec, config.rate_burst);
        FetchCache::CachedFetcher<std::string> cache(
            config.ToCacheConfig(FetchCache::MakeHttpProducer(http_fetcher, &rate_limiter)));

        PrintHelp();
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.rfind(":quit", 0) == 0) break;
            if (line.rfind(":invalidate ", 0) == 0) {
                cache.Invalidate(FetchCache::UrlUtil::NormalizeUrl(line.substr(12)));
                continue;
            }
            if (line == ":clear") { cache.InvalidateAll(); continue; }
            if (line == ":clean") { cache.Clean(); continue; }
            if (line == ":size") { std::cout << cache.Size() << std::endl; continue; }
            if (line == ":help") { PrintHelp(); continue; }

            auto urls = FetchCache::UrlUtil::ExtractUrls(line);
            if (urls.empty()) {
                std::cout << "No URL found." << std::endl;
                continue;
            }
            // Start every fetch of the line before waiting; repeated URLs share one request.
            std::vector<PendingFetch> pending;
            for (const auto& url : urls) {
                pending.push_back(StartFetch(cache, url));
            }
            for (auto& p : pending) Report(p);
        }
    } catch (const std::exception& e) {
        FetchCache::Logger::Log(FetchCache::LogLevel::Error, "Fatal: " + std::string(e.what()));
        exit_code = 1;
    }

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}
