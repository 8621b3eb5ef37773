#pragma once

#include "blat/logger/Logger.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace blat {

/**
 * Moves logging off worker threads: lines are queued and written to the
 * delegate by a single background thread. When the queue is full the line is
 * written synchronously with an "[ASYNC_BUFFER_FULL]" prefix.
 */
class AsyncLogger : public Logger {
  public:
    explicit AsyncLogger(std::unique_ptr<Logger> delegate, std::size_t capacity = 65536);
    ~AsyncLogger();

    void write(LogLevel level, std::string_view msg) override;

  private:
    class Impl;
    std::unique_ptr<Impl> fImpl;
};

} // namespace blat
