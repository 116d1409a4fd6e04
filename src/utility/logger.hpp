#pragma once

#include <functional>
#include <string>

namespace undostack {

/**
 * Thread-safe logging system with a runtime minimum level.
 *
 * Lines are formatted as `[LEVEL][HH:MM:SS.mmm][file:line] message` and
 * written to stderr, or handed to a sink when one is installed.
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    /// Receives each formatted line instead of stderr.
    using Sink = std::function<void(Level, const std::string &)>;

    static void log(Level level, const std::string &file, int line,
                    const std::string &message);

    /**
     * @brief Messages below this level are dropped. Defaults to INFO.
     */
    static void set_min_level(Level level);
    static Level min_level();

    /**
     * @brief Install a sink; an empty function restores stderr output.
     */
    static void set_sink(Sink sink);

    static const char *level_to_string(Level level);
};

} // namespace undostack

#define LOG_DEBUG(msg)                                                         \
    undostack::Logger::log(undostack::Logger::DEBUG_LEVEL, __FILE__, __LINE__, \
                           msg)
#define LOG_INFO(msg)                                                          \
    undostack::Logger::log(undostack::Logger::INFO_LEVEL, __FILE__, __LINE__,  \
                           msg)
#define LOG_WARN(msg)                                                          \
    undostack::Logger::log(undostack::Logger::WARN_LEVEL, __FILE__, __LINE__,  \
                           msg)
#define LOG_ERROR(msg)                                                         \
    undostack::Logger::log(undostack::Logger::ERROR_LEVEL, __FILE__, __LINE__, \
                           msg)
