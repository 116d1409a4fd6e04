#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

#include <fmt/format.h>

namespace undostack {

namespace {

std::mutex g_log_mutex;
std::atomic<int> g_min_level{Logger::INFO_LEVEL};
Logger::Sink g_sink;

} // namespace

void Logger::log(Level level, const std::string &file, int line,
                 const std::string &message) {
    if (level < g_min_level.load(std::memory_order_relaxed)) {
        return;
    }

    std::unique_lock<std::mutex> lock(g_log_mutex);

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    // Extract filename from full path
    std::string filename = file;
    size_t last_slash = filename.find_last_of("/\\");
    if (last_slash != std::string::npos) {
        filename = filename.substr(last_slash + 1);
    }

    std::ostringstream clock;
    clock << std::put_time(std::localtime(&time_t), "%H:%M:%S");

    std::string text =
        fmt::format("[{}][{}.{:03}][{}:{}] {}", level_to_string(level),
                    clock.str(), ms.count(), filename, line, message);

    if (!g_sink) {
        std::cerr << text << std::endl;
        return;
    }

    // The sink runs unlocked so it may log or replace itself.
    Sink sink = g_sink;
    lock.unlock();
    sink(level, text);
}

void Logger::set_min_level(Level level) {
    g_min_level.store(level, std::memory_order_relaxed);
}

Logger::Level Logger::min_level() {
    return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

const char *Logger::level_to_string(Level level) {
    switch (level) {
    case DEBUG_LEVEL:
        return "DEBUG";
    case INFO_LEVEL:
        return "INFO ";
    case WARN_LEVEL:
        return "WARN ";
    case ERROR_LEVEL:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

} // namespace undostack
