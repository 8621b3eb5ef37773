#pragma once

#include "blat/http/RequestExecutor.hpp"
#include "blat/job/Job.hpp"
#include "blat/threading/IdleTable.hpp"
#include "blat/threading/Worker.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace blat {

struct PoolOptions {
    // How long a worker waits after the dispatcher ran dry before asking again
    std::chrono::milliseconds idle_poll_interval{1000};

    // Creates one executor per job; empty means CurlExecutor
    ExecutorFactory executor_factory;
};

/**
 * Fixed-size set of workers that compete for jobs from one dispatcher.
 *
 * Architecture:
 *   - One std::thread per worker, all started by work()
 *   - Every worker pulls from the same dispatcher (which must be thread-safe)
 *   - Each job gets a fresh executor; the job is finalized on the worker and
 *     handed to the finalize callback on that same thread
 *   - Idle/active status lives in one IdleTable
 *
 * Usage:
 *   Pool pool(8, [](JobPtr job) { store(job->result()); });
 *   pool.work([&] { return queue.next(); });   // nullptr = nothing to do
 *   pool.waitUntilIdle();
 *   pool.close();                              // graceful, blocking
 *
 * Shutdown:
 *   - closeNonBlocking()/close(): workers finish the current job first
 *   - killWorkers(): in-flight transfers are aborted, their jobs never finalized
 *   - interrupt(): process-level stop; workers raise InterruptSignal, the other
 *     workers are killed and the signal is rethrown from waitUntilClosed()
 */
class Pool {
public:
    /**
     * @param size Number of workers, negative values count as 0
     * @throws ConfigurationError if finalize_callback is empty
     */
    Pool(long size, FinalizeCallback finalize_callback, PoolOptions options = {});
    ~Pool();

    // Non-copyable, non-movable (workers hold a reference)
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    /**
     * Recreate size() workers and mark every one idle. Called by work();
     * rarely useful on its own.
     */
    void initWorkers();

    /**
     * Start one thread per worker, all bound to dispatcher. A previous
     * worker set still running is closed gracefully first.
     * @throws ConfigurationError if dispatcher is empty
     */
    void work(Dispatcher dispatcher);

    // Worker status reports
    void workerActive(std::size_t worker_id);
    void workerIdle(std::size_t worker_id);
    void workerExited(std::size_t worker_id);

    /**
     * Hand a finalized job to the finalize callback (on the calling thread).
     */
    void workComplete(JobPtr job);

    bool allIdle() const;
    std::size_t countIdle() const;

    /**
     * Block until every worker is idle. Once work() has started, each worker
     * must also have reported since then, so a call made right after work()
     * does not return before the dispatcher has been drained.
     */
    void waitUntilIdle(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

    /**
     * Join every worker thread.
     * @throws InterruptSignal (or whatever escaped a worker) recorded during the run
     */
    void waitUntilClosed();

    /**
     * Force every worker to stop now and join the threads.
     */
    void killWorkers();

    /**
     * Ask every worker to stop after its current job. Does not block.
     */
    void closeNonBlocking();

    /**
     * closeNonBlocking() followed by waitUntilClosed().
     */
    void close();

    /**
     * Process-level interrupt: running transfers abort, every worker raises
     * InterruptSignal. Safe to call from any thread.
     */
    void interrupt();

    bool interruptRequested() const { return interrupted_.load(std::memory_order_acquire); }

    std::size_t size() const { return size_; }

    std::chrono::milliseconds idlePollInterval() const { return options_.idle_poll_interval; }

    /**
     * Executor for the next job, from PoolOptions::executor_factory.
     */
    std::shared_ptr<RequestExecutor> createExecutor() const;

private:
    void runWorker(Worker& worker, const Dispatcher& dispatcher);
    void signalKill();
    void recordFailure(std::exception_ptr failure);
    void joinThreads();

    std::size_t size_;
    FinalizeCallback finalize_callback_;
    PoolOptions options_;

    IdleTable idle_;

    // Guards the worker set against status calls from other threads
    mutable std::mutex workers_mutex_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::thread> threads_;
    Dispatcher dispatcher_;
    std::atomic<bool> started_{false};

    std::atomic<bool> interrupted_{false};
    std::mutex failure_mutex_;
    std::exception_ptr failure_;
};

} // namespace blat
