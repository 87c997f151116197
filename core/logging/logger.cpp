#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>

namespace littera {
namespace logging {

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

void Logger::set_level(Level level) { threshold_.store(level, std::memory_order_relaxed); }

Level Logger::level() { return threshold_.load(std::memory_order_relaxed); }

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    (void)file;
    (void)line;

    if (level < Logger::level() || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream out;
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    switch (level) {
        case Level::LVL_DEBUG:
            out << " [DEBUG] ";
            break;
        case Level::LVL_INFO:
            out << " [INFO]  ";
            break;
        case Level::LVL_WARN:
            out << " [WARN]  ";
            break;
        case Level::LVL_ERROR:
            out << " [ERROR] ";
            break;
        default:
            break;
    }
    out << message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, out.str());
        return;
    }

    std::cerr << out.str() << "\n";

    // Flush on error so nothing is lost if the host dies right after
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "debug";
        case Level::LVL_INFO:
            return "info";
        case Level::LVL_WARN:
            return "warn";
        case Level::LVL_ERROR:
            return "error";
        case Level::LVL_NONE:
            return "none";
        default:
            return "info";
    }
}

}  // namespace logging
}  // namespace littera
