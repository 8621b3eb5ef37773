#include "blat/logger/AsyncLogger.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace blat {

struct LogRecord {
    LogLevel level;
    std::string message;
};

class AsyncLogger::Impl {
  public:
    Impl(std::unique_ptr<Logger> delegate, std::size_t capacity)
        : fDelegate(std::move(delegate)), fCapacity(capacity > 0 ? capacity : 1),
          fWorkerThread(&Impl::workerThreadFunc, this) {}

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(fMutex);
            fRunning = false;
        }
        fCondition.notify_all();

        // Worker drains what is left before exiting
        if (fWorkerThread.joinable()) {
            fWorkerThread.join();
        }
    }

    void enqueue(LogLevel level, std::string_view msg) {
        {
            std::lock_guard<std::mutex> lock(fMutex);
            if (!fRunning) {
                // During shutdown, drop the message
                return;
            }
            if (fQueue.size() < fCapacity) {
                fQueue.push_back(LogRecord{level, std::string(msg)});
                fCondition.notify_one();
                return;
            }
        }

        // Queue full - fall back to synchronous logging with warning prefix
        std::string fallbackMsg = "[ASYNC_BUFFER_FULL] ";
        fallbackMsg += msg;
        std::lock_guard<std::mutex> lock(fDelegateMutex);
        fDelegate->write(level, fallbackMsg);
    }

  private:
    void workerThreadFunc() {
        std::deque<LogRecord> batch;
        while (true) {
            {
                std::unique_lock<std::mutex> lock(fMutex);
                fCondition.wait(lock, [this] { return !fRunning || !fQueue.empty(); });
                if (fQueue.empty() && !fRunning) {
                    break;
                }
                batch.swap(fQueue);
            }

            std::lock_guard<std::mutex> lock(fDelegateMutex);
            for (const auto& record : batch) {
                fDelegate->write(record.level, record.message);
            }
            batch.clear();
        }
    }

    std::unique_ptr<Logger> fDelegate;
    std::mutex fDelegateMutex;
    std::size_t fCapacity;

    std::mutex fMutex;
    std::condition_variable fCondition;
    std::deque<LogRecord> fQueue;
    bool fRunning = true;

    std::thread fWorkerThread;
};

AsyncLogger::AsyncLogger(std::unique_ptr<Logger> delegate, std::size_t capacity)
    : fImpl(std::make_unique<AsyncLogger::Impl>(std::move(delegate), capacity)) {}

AsyncLogger::~AsyncLogger() = default;

void AsyncLogger::write(LogLevel level, std::string_view msg) { fImpl->enqueue(level, msg); }

} // namespace blat
