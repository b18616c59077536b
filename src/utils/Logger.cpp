#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <fstream>
#include <cctype>

namespace FetchCache {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
std::ostream* Logger::console_ = &std::clog;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        if (console_) *console_ << "Could not create log directory " << logs_dir_ << ": " << ec.message() << std::endl;
        logs_dir_.clear();
    }
    current_date_.clear();
    min_level_ = min_level;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

LogLevel Logger::GetMinLevel() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level_;
}

void Logger::SetConsoleStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_ = stream;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back(static_cast<char>(std::tolower(c)));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning")  return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
    }
    return "Info";
}

static std::ofstream& GetFileStream() {
    static std::ofstream ofs;
    return ofs;
}

void Logger::OpenLogFileForDate(const std::string& date) {
    auto& ofs = GetFileStream();
    if (ofs.is_open()) ofs.close();
    ofs.open(logs_dir_ / (date + ".log"), std::ios::out | std::ios::app);
}

void Logger::EnsureLogFileUnlocked(const std::tm& now_tm) {
    char date[11];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &now_tm);
    if (current_date_ != date) {
        current_date_ = date;
        OpenLogFileForDate(current_date_);
    }
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level_) return;
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm buf;
    #ifdef _WIN32
    localtime_s(&buf, &in_time_t);
    #else
    localtime_r(&in_time_t, &buf);
    #endif

    if (console_) {
        *console_ << std::put_time(&buf, "%Y-%m-%d %X") << " [" << ToString(level) << "] " << message << std::endl;
    }

    // logs/YYYY-MM-DD.log, reopened when the date changes
    if (!logs_dir_.empty()) {
        EnsureLogFileUnlocked(buf);
        auto& ofs = GetFileStream();
        if (ofs.is_open()) {
            ofs << std::put_time(&buf, "%Y-%m-%d %X") << " [" << ToString(level) << "] " << message << std::endl;
        }
    }
}

}
