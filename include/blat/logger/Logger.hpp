#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace blat {

enum class LogLevel : uint8_t { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

const char* logLevelName(LogLevel level);

class Logger {
public:
    virtual ~Logger() = default;

    /**
     * Write one line at the given level. Implementations receive only lines
     * at or above the minimum level.
     */
    virtual void write(LogLevel level, std::string_view msg) = 0;

    void log(LogLevel level, std::string_view msg) {
        if (level >= minLevel()) {
            write(level, msg);
        }
    }

    void logDebug(std::string_view msg) { log(LogLevel::DEBUG, msg); }
    void logMessage(std::string_view msg) { log(LogLevel::INFO, msg); }
    void logWarning(std::string_view msg) { log(LogLevel::WARN, msg); }
    void logError(std::string_view msg) { log(LogLevel::ERROR, msg); }

    /**
     * Log the current exception with a context message.
     * Should be called from within a catch block.
     * Combines the provided message with the exception details.
     */
    void logCurrentError(std::string_view context_msg, LogLevel level = LogLevel::ERROR);

    void setMinLevel(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const { return min_level_.load(std::memory_order_relaxed); }

    static void setGlobalLogger(Logger* ptr);
    static Logger& getInstance();

private:
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
};

} // namespace blat
