#include "blat/threading/CompletionQueue.hpp"

#include <iterator>
#include <utility>

namespace blat {

FinalizeCallback CompletionQueue::sink() {
    return [this](JobPtr job) { push(std::move(job)); };
}

void CompletionQueue::push(JobPtr job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    available_.notify_one();
}

JobPtr CompletionQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.empty()) {
        return nullptr;
    }
    JobPtr job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
}

JobPtr CompletionQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !jobs_.empty(); })) {
        return nullptr;
    }
    JobPtr job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
}

std::vector<JobPtr> CompletionQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobPtr> out(std::make_move_iterator(jobs_.begin()),
                            std::make_move_iterator(jobs_.end()));
    jobs_.clear();
    return out;
}

std::size_t CompletionQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool CompletionQueue::empty() const {
    return size() == 0;
}

} // namespace blat
