
#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace HonestMark {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};
std::ofstream Logger::file_{};

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Cannot create log directory " << logs_dir_.string() << ": " << ec.message() << std::endl;
        logs_dir_.clear();
    }
    min_level_ = min_level;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning")  return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "";
}

void Logger::RotateIfNeededUnlocked(const std::tm& now_tm) {
    std::ostringstream date;
    date << std::put_time(&now_tm, "%Y-%m-%d");
    if (date.str() == current_date_ && file_.is_open()) return;

    current_date_ = date.str();
    if (file_.is_open()) file_.close();
    file_.open(logs_dir_ / (current_date_ + ".log"), std::ios::out | std::ios::app);
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

    std::ostringstream line;
    line << std::put_time(&buf, "%Y-%m-%d %X") << " [" << ToString(level) << "] [" << std::this_thread::get_id() << "] " << message;

    auto& out = level >= LogLevel::Warn ? std::cerr : std::cout;
    out << line.str() << std::endl;

    if (!logs_dir_.empty()) {
        RotateIfNeededUnlocked(buf);
        if (file_.is_open()) {
            file_ << line.str() << std::endl;
        }
    }
}

}
