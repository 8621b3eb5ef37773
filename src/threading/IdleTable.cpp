#include "blat/threading/IdleTable.hpp"

#include <algorithm>

namespace blat {

void IdleTable::reset(std::size_t count) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.assign(count, Slot{});
    }
    changed_.notify_all();
}

void IdleTable::markActive(std::size_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot& slot = slots_.at(id);
        slot.idle = false;
        slot.reported = true;
    }
    changed_.notify_all();
}

void IdleTable::markIdle(std::size_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot& slot = slots_.at(id);
        slot.idle = true;
        slot.reported = true;
    }
    changed_.notify_all();
}

void IdleTable::markExited(std::size_t id) {
    markIdle(id);
}

bool IdleTable::allIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allIdleLocked();
}

std::size_t IdleTable::countIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const Slot& s) { return s.idle; }));
}

std::size_t IdleTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool IdleTable::settled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settledLocked();
}

void IdleTable::waitUntilIdle(bool require_reports, std::chrono::milliseconds recheck) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this, require_reports] {
        return require_reports ? settledLocked() : allIdleLocked();
    };
    while (!ready()) {
        changed_.wait_for(lock, recheck);
    }
}

bool IdleTable::allIdleLocked() const {
    return std::all_of(slots_.begin(), slots_.end(), [](const Slot& s) { return s.idle; });
}

bool IdleTable::settledLocked() const {
    return std::all_of(slots_.begin(), slots_.end(),
                       [](const Slot& s) { return s.idle && s.reported; });
}

} // namespace blat
