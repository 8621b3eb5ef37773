#pragma once

#include "blat/job/Job.hpp"
#include "blat/threading/Worker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace blat {

/**
 * Channel of finalized jobs that the pool owner drains on its own thread.
 *
 * Pass sink() as the pool's finalize callback; workers only enqueue, so no
 * caller code runs on worker threads.
 *
 * Usage:
 *   CompletionQueue done;
 *   Pool pool(4, done.sink());
 *   pool.work(dispatcher);
 *   while (auto job = done.popFor(std::chrono::seconds(1))) { ... }
 *
 * The queue must outlive every pool that holds its sink.
 */
class CompletionQueue {
public:
    CompletionQueue() = default;

    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    FinalizeCallback sink();

    void push(JobPtr job);

    // nullptr when empty
    JobPtr tryPop();

    // nullptr on timeout
    JobPtr popFor(std::chrono::milliseconds timeout);

    // Everything queued right now, oldest first
    std::vector<JobPtr> drain();

    std::size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<JobPtr> jobs_;
};

} // namespace blat
