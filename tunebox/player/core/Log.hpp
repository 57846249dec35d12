#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <memory>

namespace tunebox {

enum class LogLevel { Debug = 0, Info, Warning, Error };

LogLevel parseLogLevel(const juce::String& text, LogLevel fallback = LogLevel::Info);
juce::String toString(LogLevel level);

/**
 * @brief juce::Logger that writes "timestamp - LEVEL - message" lines to stdout
 *
 * Optionally mirrors every line into a juce::FileLogger. Installed once at
 * startup with juce::Logger::setCurrentLogger(); everything else logs through
 * the log:: helpers below, which apply the level filter first.
 */
class ConsoleLogger : public juce::Logger {
  public:
    explicit ConsoleLogger(const juce::File& logFile = {});
    ~ConsoleLogger() override;

    static void setMinimumLevel(LogLevel level);
    static LogLevel getMinimumLevel();
    static bool isEnabled(LogLevel level);

    /** Builds the line written for a message, without trailing newline. */
    static juce::String formatLine(LogLevel level, const juce::String& message,
                                   juce::Time time = juce::Time::getCurrentTime());

  protected:
    void logMessage(const juce::String& message) override;

  private:
    std::unique_ptr<juce::FileLogger> fileLogger_;
    juce::CriticalSection writeLock_;

    static std::atomic<int> minimumLevel_;

    JUCE_DECLARE_NON_COPYABLE(ConsoleLogger)
};

namespace log {

void write(LogLevel level, const juce::String& message);

inline void debug(const juce::String& message) {
    write(LogLevel::Debug, message);
}
inline void info(const juce::String& message) {
    write(LogLevel::Info, message);
}
inline void warning(const juce::String& message) {
    write(LogLevel::Warning, message);
}
inline void error(const juce::String& message) {
    write(LogLevel::Error, message);
}

}  // namespace log

}  // namespace tunebox
