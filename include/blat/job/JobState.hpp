#pragma once

#include <atomic>

namespace blat {

/**
 * Lock-free state machine for the single finalize transition of a Job.
 *
 * State Transitions:
 * - PENDING -> FINALIZING: a writer claims the result slot (tryBeginFinalize)
 * - FINALIZING -> FINALIZED: the writer published the result (commit)
 *
 * A second writer loses the compare-exchange in tryBeginFinalize and must
 * not touch the result slot. Readers that see FINALIZED (acquire) see the
 * complete result written before commit (release).
 *
 * Example Usage:
 * ```cpp
 * void Job::finalize(Result result) {
 *     if (!state_.tryBeginFinalize()) throw AlreadyFinalizedError();
 *     result_ = std::move(result);
 *     state_.commit();
 * }
 * ```
 */
class JobState {
public:
    enum class State : int {
        PENDING = 0,     // No result yet
        FINALIZING = 1,  // A writer owns the result slot
        FINALIZED = 2    // Result published, immutable
    };

    JobState() : state_(State::PENDING) {}

    /**
     * Claim the result slot.
     * Attempts transition: PENDING -> FINALIZING
     *
     * @return true if this caller now owns the slot, false if another
     *         finalize already started or completed
     */
    bool tryBeginFinalize() {
        State expected = State::PENDING;
        return state_.compare_exchange_strong(
            expected,
            State::FINALIZING,
            std::memory_order_acq_rel,
            std::memory_order_relaxed
        );
    }

    /**
     * Publish the result written by the owner of the slot.
     * Transition: FINALIZING -> FINALIZED
     */
    void commit() {
        state_.store(State::FINALIZED, std::memory_order_release);
    }

    bool isFinalized() const {
        return state_.load(std::memory_order_acquire) == State::FINALIZED;
    }

    State getState() const {
        return state_.load(std::memory_order_acquire);
    }

private:
    std::atomic<State> state_;
};

} // namespace blat
