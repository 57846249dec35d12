#include <catch2/catch_test_macros.hpp>

#include "tunebox/player/core/Log.hpp"

using namespace tunebox;

namespace {

struct LevelGuard {
    LogLevel saved = ConsoleLogger::getMinimumLevel();
    ~LevelGuard() {
        ConsoleLogger::setMinimumLevel(saved);
    }
};

}  // namespace

TEST_CASE("Log level names", "[log]") {
    REQUIRE(parseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(parseLogLevel(" INFO ") == LogLevel::Info);
    REQUIRE(parseLogLevel("warn") == LogLevel::Warning);
    REQUIRE(parseLogLevel("error") == LogLevel::Error);
    REQUIRE(parseLogLevel("loud", LogLevel::Warning) == LogLevel::Warning);
    REQUIRE(toString(LogLevel::Warning) == "WARNING");
}

TEST_CASE("Log lines carry timestamp and level", "[log]") {
    juce::Time time(2026, 9, 19, 8, 10, 0, 0, true);
    REQUIRE(ConsoleLogger::formatLine(LogLevel::Info, "Loaded 4 audio files", time) ==
            "2026-10-19 08:10:00 - INFO - Loaded 4 audio files");
}

TEST_CASE("Log level filter", "[log]") {
    LevelGuard guard;

    ConsoleLogger::setMinimumLevel(LogLevel::Warning);
    REQUIRE_FALSE(ConsoleLogger::isEnabled(LogLevel::Debug));
    REQUIRE_FALSE(ConsoleLogger::isEnabled(LogLevel::Info));
    REQUIRE(ConsoleLogger::isEnabled(LogLevel::Warning));
    REQUIRE(ConsoleLogger::isEnabled(LogLevel::Error));
}

TEST_CASE("ConsoleLogger mirrors lines into the log file", "[log]") {
    LevelGuard guard;
    ConsoleLogger::setMinimumLevel(LogLevel::Debug);

    juce::TemporaryFile temp(".log");
    {
        ConsoleLogger logger(temp.getFile());
        juce::Logger::setCurrentLogger(&logger);

        log::info("hello from the test");
        log::debug("debug detail");

        juce::Logger::setCurrentLogger(nullptr);
    }

    auto contents = temp.getFile().loadFileAsString();
    REQUIRE(contents.contains("INFO - hello from the test"));
    REQUIRE(contents.contains("DEBUG - debug detail"));
}
