#pragma once

#include "blat/job/Job.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

namespace blat {

class Pool;

/**
 * Pull source of jobs. Called concurrently by every worker; nullptr means
 * "no work right now". Must not block indefinitely.
 */
using Dispatcher = std::function<JobPtr()>;

/**
 * Receives every finalized job, on the thread of the worker that ran it.
 * Different workers may call it concurrently.
 */
using FinalizeCallback = std::function<void(JobPtr)>;

/**
 * One thread-bound loop that pulls jobs from the dispatcher, performs them
 * and reports completion to its pool.
 *
 * Workers are created and owned by a Pool and are not reused once work()
 * returns.
 */
class Worker {
public:
    Worker(std::size_t id, Pool& pool);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * Run until the dispatcher is drained and close() was requested, or until
     * kill(). Blocks the calling thread.
     * @throws InterruptSignal when the pool was interrupted
     */
    void work(const Dispatcher& dispatcher);

    /**
     * Ask the loop to stop after the current job or idle wait.
     */
    void close();

    /**
     * Stop immediately; an in-flight transfer is aborted and its job is left
     * unfinalized.
     */
    void kill();

    /**
     * Cut an idle wait short so the loop re-checks its flags.
     */
    void wake();

    bool abortRequested() const {
        return abort_.load(std::memory_order_acquire) || killed();
    }

    bool killed() const { return killed_.load(std::memory_order_acquire); }

    std::size_t id() const { return id_; }

private:
    void completeRequest(const JobPtr& job);
    void waitIdle(std::chrono::milliseconds interval);
    void checkInterrupt() const;
    bool shouldCancel() const;

    std::size_t id_;
    Pool& pool_;
    std::atomic<bool> abort_{false};
    std::atomic<bool> killed_{false};

    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

} // namespace blat
