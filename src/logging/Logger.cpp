#include "blat/logger/Logger.hpp"
#include "blat/logger/ConsoleLogger.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace {
    static std::atomic<blat::Logger*> logger{nullptr};
}
namespace blat {

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::logCurrentError(std::string_view context_msg, LogLevel level) {
    auto eptr = std::current_exception();
    std::string full_message = std::string(context_msg);

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            full_message += ": ";
            full_message += e.what();
        } catch (...) {
            full_message += ": unknown exception type";
        }
    } else {
        full_message += ": no current exception";
    }

    log(level, full_message);
}

void Logger::setGlobalLogger(Logger* ptr) {
    logger.store(ptr, std::memory_order_release);
}

Logger& Logger::getInstance() {
    auto* ptr = logger.load(std::memory_order_acquire);
    if (!ptr) {
        // Fallback when the application never installed a logger
        static blat::ConsoleLogger* fallback_logger = new blat::ConsoleLogger();
        return *fallback_logger;
    }
    return *ptr;
}

} // namespace blat
