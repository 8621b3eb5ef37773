#include "blat/threading/Pool.hpp"
#include "blat/Errors.hpp"
#include "blat/http/CurlExecutor.hpp"
#include "blat/logger/Logger.hpp"

#include <utility>

namespace blat {

Pool::Pool(long size, FinalizeCallback finalize_callback, PoolOptions options)
    : size_(size > 0 ? static_cast<std::size_t>(size) : 0),
      finalize_callback_(std::move(finalize_callback)),
      options_(std::move(options)) {
    if (!finalize_callback_) {
        throw ConfigurationError("No callback given for final data");
    }
    if (!options_.executor_factory) {
        options_.executor_factory = &CurlExecutor::create;
    }
}

Pool::~Pool() {
    bool running = false;
    for (const auto& thread : threads_) {
        running = running || thread.joinable();
    }
    if (!running) {
        return;
    }

    Logger::getInstance().logWarning("Pool: Destroyed with " + std::to_string(threads_.size()) +
                                     " live worker thread[s], killing them");
    killWorkers();

    std::lock_guard<std::mutex> lock(failure_mutex_);
    if (failure_) {
        try {
            std::rethrow_exception(failure_);
        } catch (const std::exception& e) {
            Logger::getInstance().logError(std::string("Pool: Dropping worker failure: ") + e.what());
        }
    }
}

void Pool::initWorkers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);

    workers_.clear();
    workers_.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        workers_.push_back(std::make_unique<Worker>(i, *this));
    }

    // Every slot exists before any thread can report into it
    idle_.reset(size_);
}

void Pool::work(Dispatcher dispatcher) {
    if (!dispatcher) {
        throw ConfigurationError("No dispatcher provided");
    }

    if (!threads_.empty()) {
        Logger::getInstance().logMessage("Pool: Restarting, closing " +
                                         std::to_string(threads_.size()) + " previous worker[s]");
        close();
    }

    interrupted_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        failure_ = nullptr;
    }

    dispatcher_ = std::move(dispatcher);
    initWorkers();
    started_.store(true, std::memory_order_release);

    threads_.reserve(workers_.size());
    for (auto& worker : workers_) {
        threads_.emplace_back(&Pool::runWorker, this, std::ref(*worker), std::cref(dispatcher_));
    }

    Logger::getInstance().logMessage("Pool: " + std::to_string(threads_.size()) +
                                     " download thread[s] started");
}

void Pool::runWorker(Worker& worker, const Dispatcher& dispatcher) {
    try {
        worker.work(dispatcher);
    } catch (const InterruptSignal& e) {
        if (!worker.killed()) {
            Logger::getInstance().logError("Pool: W" + std::to_string(worker.id()) +
                                           ": Interrupt caught (" + e.what() +
                                           "), killing workers before shutdown");
            recordFailure(std::current_exception());
            signalKill();
        }
    } catch (const std::exception& e) {
        // Worker::work only lets interrupts through; anything else is a bug
        Logger::getInstance().logError("Pool: W" + std::to_string(worker.id()) +
                                       ": Worker loop failed: " + e.what());
        recordFailure(std::current_exception());
        signalKill();
    } catch (...) {
        Logger::getInstance().logCurrentError("Pool: W" + std::to_string(worker.id()) +
                                              ": Worker loop failed");
        recordFailure(std::current_exception());
        signalKill();
    }

    workerExited(worker.id());
}

void Pool::workerActive(std::size_t worker_id) {
    idle_.markActive(worker_id);
}

void Pool::workerIdle(std::size_t worker_id) {
    idle_.markIdle(worker_id);
}

void Pool::workerExited(std::size_t worker_id) {
    idle_.markExited(worker_id);
}

void Pool::workComplete(JobPtr job) {
    finalize_callback_(std::move(job));
}

bool Pool::allIdle() const {
    return idle_.allIdle();
}

std::size_t Pool::countIdle() const {
    return idle_.countIdle();
}

void Pool::waitUntilIdle(std::chrono::milliseconds poll_interval) {
    if (poll_interval.count() <= 0) {
        poll_interval = std::chrono::milliseconds(1);
    }
    idle_.waitUntilIdle(started_.load(std::memory_order_acquire), poll_interval);
}

void Pool::waitUntilClosed() {
    joinThreads();
    Logger::getInstance().logMessage("Pool: Workers all terminated");

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        failure = std::exchange(failure_, nullptr);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void Pool::killWorkers() {
    Logger::getInstance().logMessage("Pool: Forcing " + std::to_string(threads_.size()) +
                                     " worker thread[s] to die");
    signalKill();

    const auto self = std::this_thread::get_id();
    for (auto& thread : threads_) {
        if (thread.joinable() && thread.get_id() != self) {
            thread.join();
        }
    }
}

void Pool::closeNonBlocking() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
        worker->close();
    }
}

void Pool::close() {
    closeNonBlocking();
    waitUntilClosed();
}

void Pool::interrupt() {
    interrupted_.store(true, std::memory_order_release);
    recordFailure(std::make_exception_ptr(InterruptSignal("Pool interrupted")));

    // Idle workers notice at their next checkpoint; wake them for it
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
        worker->wake();
    }
}

std::shared_ptr<RequestExecutor> Pool::createExecutor() const {
    return options_.executor_factory();
}

void Pool::signalKill() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
        worker->kill();
    }
}

void Pool::recordFailure(std::exception_ptr failure) {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    if (!failure_) {
        failure_ = std::move(failure);
    }
}

void Pool::joinThreads() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

} // namespace blat
