#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "../src/cache/FetchOptions.hpp"

namespace FetchCache {
    struct Config {
        long default_ttl_ms = 60000;       // <= 0 never expires
        long clean_interval_ms = 0;        // 0 disables the periodic sweep
        bool cache_errors = false;
        bool double_buffer = false;
        std::string log_level = "info";
        std::string log_dir = "";          // empty: console only
        long http_timeout_ms = 4000;
        long http_max_redirects = 5;
        std::string http_user_agent = "FetchCache/1.0";
        size_t max_body_bytes = 8388608;   // 8MB
        double rate_per_sec = 2.0;
        double rate_burst = 4.0;

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;

        template<typename T>
        CacheConfig<T> ToCacheConfig(Fetcher<T> fetcher) const {
            CacheConfig<T> cfg;
            cfg.default_ttl = std::chrono::milliseconds(default_ttl_ms);
            cfg.clean_interval = std::chrono::milliseconds(clean_interval_ms > 0 ? clean_interval_ms : 0);
            cfg.cache_errors = cache_errors;
            cfg.double_buffer = double_buffer;
            cfg.fetcher = std::move(fetcher);
            return cfg;
        }
    };
}
