#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace HonestMark {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    // Process-wide logger. Writes to stdout and, once Init() has been called,
    // to <base_dir>/logs/YYYY-MM-DD.log.
    class Logger {
    public:
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static void Log(LogLevel level, const std::string& message);
    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static std::ofstream file_;
        static void RotateIfNeededUnlocked(const std::tm& now_tm);
    };
}
