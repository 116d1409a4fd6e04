#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

#include "undo/history.hpp"
#include "utility/logger.hpp"

using undostack::Logger;

namespace {

/**
 * @brief Captures logger output for the lifetime of the object.
 */
class CapturedLog {
  public:
    CapturedLog() : m_previous_level(Logger::min_level()) {
        Logger::set_sink([this](Logger::Level level, const std::string &line) {
            m_lines.emplace_back(level, line);
        });
    }

    ~CapturedLog() {
        Logger::set_sink({});
        Logger::set_min_level(m_previous_level);
    }

    const std::vector<std::pair<Logger::Level, std::string>> &lines() const {
        return m_lines;
    }

  private:
    Logger::Level m_previous_level;
    std::vector<std::pair<Logger::Level, std::string>> m_lines;
};

} // namespace

TEST_CASE("Logger - Level filtering", "[logger]") {
    CapturedLog log;
    Logger::set_min_level(Logger::WARN_LEVEL);

    LOG_DEBUG("debug message");
    LOG_INFO("info message");
    LOG_WARN("warn message");
    LOG_ERROR("error message");

    REQUIRE(log.lines().size() == 2);
    REQUIRE(log.lines()[0].first == Logger::WARN_LEVEL);
    REQUIRE(log.lines()[1].first == Logger::ERROR_LEVEL);
}

TEST_CASE("Logger - Line format", "[logger]") {
    CapturedLog log;
    Logger::set_min_level(Logger::DEBUG_LEVEL);

    LOG_INFO("hello");

    REQUIRE(log.lines().size() == 1);
    const std::string &line = log.lines().front().second;
    REQUIRE(line.rfind("[INFO ][", 0) == 0);
    REQUIRE(line.find("[test_logger.cpp:") != std::string::npos);
    REQUIRE(line.find("] hello") != std::string::npos);
}

TEST_CASE("Logger - History diagnostics without a handler", "[logger]") {
    CapturedLog log;
    Logger::set_min_level(Logger::WARN_LEVEL);

    SECTION("Quiet by default") {
        undostack::History<int> history;
        history.finish_group();
        REQUIRE(log.lines().empty());
    }

    SECTION("Warnings when verbose") {
        undostack::HistoryConfig config;
        config.verbose = true;
        undostack::History<int> history(config);
        history.finish_group();

        REQUIRE(log.lines().size() == 1);
        REQUIRE(log.lines().front().first == Logger::WARN_LEVEL);
        REQUIRE(log.lines().front().second.find("UnmatchedClose") !=
                std::string::npos);
    }
}

TEST_CASE("Logger - A sink may log and replace itself", "[logger]") {
    CapturedLog log;
    Logger::set_min_level(Logger::DEBUG_LEVEL);

    SECTION("Logging from inside the sink") {
        std::vector<std::string> lines;
        bool nested = false;
        Logger::set_sink([&](Logger::Level, const std::string &line) {
            lines.push_back(line);
            if (!nested) {
                nested = true;
                LOG_INFO("from sink");
            }
        });

        LOG_INFO("outer");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].find("] outer") != std::string::npos);
        REQUIRE(lines[1].find("] from sink") != std::string::npos);
    }

    SECTION("Replacing the sink from inside the sink") {
        int replacement_calls = 0;
        Logger::set_sink([&](Logger::Level, const std::string &) {
            Logger::set_sink([&](Logger::Level, const std::string &) {
                ++replacement_calls;
            });
        });

        LOG_INFO("first");
        LOG_INFO("second");
        REQUIRE(replacement_calls == 1);
    }
}
