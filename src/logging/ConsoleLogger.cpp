#include "blat/logger/ConsoleLogger.hpp"

#include <iostream>

namespace blat {

void ConsoleLogger::write(LogLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= LogLevel::WARN) {
        std::cerr << "[" << logLevelName(level) << "] " << msg << std::endl;
    } else {
        std::cout << "[" << logLevelName(level) << "] " << msg << std::endl;
    }
}

} // namespace blat
