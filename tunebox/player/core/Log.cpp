#include "Log.hpp"

#include <iostream>

namespace tunebox {

std::atomic<int> ConsoleLogger::minimumLevel_{static_cast<int>(LogLevel::Info)};

LogLevel parseLogLevel(const juce::String& text, LogLevel fallback) {
    auto name = text.trim().toLowerCase();
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warning" || name == "warn")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    return fallback;
}

juce::String toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

ConsoleLogger::ConsoleLogger(const juce::File& logFile) {
    if (logFile != juce::File()) {
        fileLogger_ = std::make_unique<juce::FileLogger>(logFile, "TuneBox log");
    }
}

ConsoleLogger::~ConsoleLogger() = default;

void ConsoleLogger::setMinimumLevel(LogLevel level) {
    minimumLevel_.store(static_cast<int>(level));
}

LogLevel ConsoleLogger::getMinimumLevel() {
    return static_cast<LogLevel>(minimumLevel_.load());
}

bool ConsoleLogger::isEnabled(LogLevel level) {
    return static_cast<int>(level) >= minimumLevel_.load();
}

juce::String ConsoleLogger::formatLine(LogLevel level, const juce::String& message,
                                       juce::Time time) {
    return time.formatted("%Y-%m-%d %H:%M:%S") + " - " + toString(level) + " - " + message;
}

void ConsoleLogger::logMessage(const juce::String& message) {
    const juce::ScopedLock sl(writeLock_);
    std::cout << message << std::endl;

    if (fileLogger_) {
        fileLogger_->logMessage(message);
    }
}

namespace log {

void write(LogLevel level, const juce::String& message) {
    if (!ConsoleLogger::isEnabled(level))
        return;

    juce::Logger::writeToLog(ConsoleLogger::formatLine(level, message));
}

}  // namespace log

}  // namespace tunebox
