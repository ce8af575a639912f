#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace agentlink {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    // Redirect output (tests capture into a stringstream). nullptr restores std::cerr.
    static void set_sink(std::ostream *sink);

    static bool enabled(Level level) { return level >= threshold_; }
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static Level threshold_;
    static std::ostream *sink_;
    static std::mutex mutex_;
};

// Case-insensitive; unknown strings map to INFO
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace agentlink

#define LOG_INTERNAL(level, msg)                                                  \
    do {                                                                          \
        if (agentlink::logging::Logger::enabled(level)) {                         \
            std::ostringstream log_stream_;                                       \
            log_stream_ << msg;                                                   \
            agentlink::logging::Logger::log(level, __FILE__, __LINE__, log_stream_.str()); \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(agentlink::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(agentlink::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(agentlink::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(agentlink::logging::Level::LVL_ERROR, msg)
