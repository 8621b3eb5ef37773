#pragma once

#include "blat/logger/Logger.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace blat {

/**
 * File logger that writes timestamped, level-tagged lines to a file.
 * Writes are serialized internally; wrap in AsyncLogger to keep worker
 * threads off the disk.
 */
class FileLogger : public Logger {
  public:
    /**
     * Create a file logger.
     * @param filepath Path to log file (will be created/appended to)
     * @param auto_flush If true, flush after each log message (safer but slower)
     */
    explicit FileLogger(const std::string& filepath, bool auto_flush = true);
    ~FileLogger();

    void write(LogLevel level, std::string_view msg) override;

    bool isOpen() const;

    // Manually flush the log file
    void flush();

    // Reopen the log file (for log rotation via SIGHUP)
    void reopen();

  private:
    void writeLine(LogLevel level, std::string_view msg);

    mutable std::mutex mutex_;
    std::ofstream file_;
    bool auto_flush_;
    std::string filepath_;
};

} // namespace blat
