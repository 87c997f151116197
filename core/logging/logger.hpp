#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace littera {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    // Receives every formatted line that passes the threshold (without trailing newline).
    // When unset, lines go to stderr.
    using Sink = std::function<void(Level, const std::string &)>;

    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Replace the output sink; pass nullptr to restore stderr output
    static void set_sink(Sink sink);

private:
    static std::atomic<Level> threshold_;
    static Sink sink_;
    static std::mutex mutex_;
};

// Config parsing helpers
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace littera

#define LITTERA_LOG_INTERNAL(lvl, msg)                                            \
    do {                                                                          \
        if ((lvl) >= littera::logging::Logger::level()) {                         \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            littera::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str());     \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LITTERA_LOG_INTERNAL(littera::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LITTERA_LOG_INTERNAL(littera::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LITTERA_LOG_INTERNAL(littera::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LITTERA_LOG_INTERNAL(littera::logging::Level::LVL_ERROR, msg)
