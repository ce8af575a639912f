#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace agentlink {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::ostream *Logger::sink_ = nullptr;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { threshold_ = threshold; }

void Logger::set_level(Level level) { threshold_ = level; }

Level Logger::level() { return threshold_; }

void Logger::set_sink(std::ostream *sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::log(Level level, const char * /*file*/, int /*line*/, const std::string &message) {
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream &out = sink_ != nullptr ? *sink_ : std::cerr;

    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
        << ms.count() << "] [" << level_to_string(level) << "] " << message << "\n";

    // Flush on error so crash diagnostics are not lost
    if (level >= Level::LVL_ERROR) {
        out << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(::toupper(c)); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN" || s == "WARNING") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE" || s == "OFF") return Level::LVL_NONE;

    return Level::LVL_INFO;
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "DEBUG";
        case Level::LVL_INFO:
            return "INFO";
        case Level::LVL_WARN:
            return "WARN";
        case Level::LVL_ERROR:
            return "ERROR";
        default:
            return "NONE";
    }
}

}  // namespace logging
}  // namespace agentlink
