#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

namespace blat {

/**
 * Idle/active status of every worker, guarded by one lock.
 *
 * Each slot also remembers whether its worker has reported since the last
 * reset(). A slot that is idle only because it was never touched is not
 * "settled": waiting callers use this to tell "all workers drained the
 * dispatcher" apart from "no worker has looked yet".
 *
 * Every transition notifies waiters.
 */
class IdleTable {
public:
    /**
     * Resize to count slots, all idle and none reported.
     */
    void reset(std::size_t count);

    // @throws std::out_of_range for an unknown worker index
    void markActive(std::size_t id);
    void markIdle(std::size_t id);

    /**
     * The worker's loop returned; it counts as idle and reported from now on.
     */
    void markExited(std::size_t id);

    bool allIdle() const;
    std::size_t countIdle() const;
    std::size_t size() const;

    /**
     * All idle, and every slot was reported idle or exited since reset().
     */
    bool settled() const;

    /**
     * Block until allIdle() (or settled() when require_reports is set).
     * The condition is re-checked on every transition and at least once per
     * recheck interval.
     */
    void waitUntilIdle(bool require_reports, std::chrono::milliseconds recheck) const;

private:
    struct Slot {
        bool idle = true;
        bool reported = false;
    };

    bool allIdleLocked() const;
    bool settledLocked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::vector<Slot> slots_;
};

} // namespace blat
