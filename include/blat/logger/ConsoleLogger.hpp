#pragma once

#include "blat/logger/Logger.hpp"

#include <mutex>

namespace blat {

// INFO and DEBUG go to stdout, WARN and ERROR to stderr
class ConsoleLogger : public Logger {
  public:
    void write(LogLevel level, std::string_view msg) override;

  private:
    std::mutex mutex_;
};

} // namespace blat
