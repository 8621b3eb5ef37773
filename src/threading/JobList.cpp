#include "blat/threading/JobList.hpp"

#include <iterator>
#include <utility>

namespace blat {

JobList::JobList(std::vector<JobPtr> jobs)
    : jobs_(std::make_move_iterator(jobs.begin()), std::make_move_iterator(jobs.end())) {}

void JobList::push(JobPtr job) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push_back(std::move(job));
}

JobPtr JobList::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.empty()) {
        return nullptr;
    }
    JobPtr job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
}

std::size_t JobList::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

Dispatcher JobList::dispatcher() {
    return [this] { return next(); };
}

} // namespace blat
