#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace tactile {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void set_level(Level level);
    static Level level();

    // Cheap check used by the LOG_* macros before formatting the message
    static bool enabled(Level level);

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

const char *level_to_string(Level level);

// Strict parse for config values: "debug", "info", "warn", "error" (any case)
std::optional<Level> parse_level(const std::string &level_str);

}  // namespace logging
}  // namespace tactile

#define TACTILE_LOG_INTERNAL(level, msg)                                            \
    do {                                                                            \
        if (tactile::logging::Logger::enabled(level)) {                             \
            std::ostringstream tactile_log_ss_;                                     \
            tactile_log_ss_ << msg;                                                 \
            tactile::logging::Logger::log(level, __FILE__, __LINE__, tactile_log_ss_.str()); \
        }                                                                           \
    } while (0)

#define LOG_DEBUG(msg) TACTILE_LOG_INTERNAL(tactile::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) TACTILE_LOG_INTERNAL(tactile::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) TACTILE_LOG_INTERNAL(tactile::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) TACTILE_LOG_INTERNAL(tactile::logging::Level::LVL_ERROR, msg)
