#pragma once
#include <string>
#include <mutex>
#include <ostream>
#include <ctime>
#include <filesystem>

namespace FetchCache {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        // Enables the daily file sink under base_dir/logs. Console output works without it.
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel GetMinLevel();
        // nullptr silences the console sink.
        static void SetConsoleStream(std::ostream* stream);
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static void Log(LogLevel level, const std::string& message);
    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static std::ostream* console_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
    };
}
