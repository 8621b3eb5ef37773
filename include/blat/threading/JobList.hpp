#pragma once

#include "blat/job/Job.hpp"
#include "blat/threading/Worker.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace blat {

// Thread-safe FIFO of pending jobs that can serve as a pool's dispatcher
class JobList {
public:
    JobList() = default;
    explicit JobList(std::vector<JobPtr> jobs);

    JobList(const JobList&) = delete;
    JobList& operator=(const JobList&) = delete;

    void push(JobPtr job);

    // nullptr when empty
    JobPtr next();

    std::size_t size() const;

    /**
     * Dispatcher pulling from this list. The list must outlive the pool's
     * workers.
     */
    Dispatcher dispatcher();

private:
    mutable std::mutex mutex_;
    std::deque<JobPtr> jobs_;
};

} // namespace blat
