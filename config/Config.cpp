#include "Config.hpp"
#include "../src/utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace FetchCache {

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }

    const Config defaults;
    default_ttl_ms = data.value("default_ttl_ms", defaults.default_ttl_ms);
    clean_interval_ms = data.value("clean_interval_ms", defaults.clean_interval_ms);
    cache_errors = data.value("cache_errors", defaults.cache_errors);
    double_buffer = data.value("double_buffer", defaults.double_buffer);
    log_level = data.value("log_level", defaults.log_level);
    log_dir = data.value("log_dir", defaults.log_dir);
    http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
    http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
    http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
    max_body_bytes = data.value("max_body_bytes", defaults.max_body_bytes);
    rate_per_sec = data.value("rate_per_sec", defaults.rate_per_sec);
    rate_burst = data.value("rate_burst", defaults.rate_burst);

    // Write back missing keys so an existing config.json picks up newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up config to " + bak.string() + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            // Startup continues with the values already loaded
            Logger::Log(LogLevel::Warn, "Could not write missing keys back to " + path);
        } else {
            Logger::Log(LogLevel::Info, "Added missing keys to " + path);
        }
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["default_ttl_ms"] = default_ttl_ms;
    data["clean_interval_ms"] = clean_interval_ms;
    data["cache_errors"] = cache_errors;
    data["double_buffer"] = double_buffer;
    data["log_level"] = log_level;
    data["log_dir"] = log_dir;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["max_body_bytes"] = max_body_bytes;
    data["rate_per_sec"] = rate_per_sec;
    data["rate_burst"] = rate_burst;
    return data;
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << Config{}.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
