#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

namespace blat {

/**
 * Delivers process signals to a handler on a dedicated thread.
 *
 * The signals are blocked in the constructing thread (and every thread it
 * spawns afterwards), then collected with sigwait() by a watcher thread.
 * Threads started before that still receive them asynchronously, so call
 * blockSignals() first thing in main() when the watcher itself has to be
 * created later.
 *
 * Usage:
 *   SignalWatcher::blockSignals({SIGINT, SIGTERM});
 *   ...                                  // start loggers, build the pool
 *   SignalWatcher watcher({SIGINT, SIGTERM}, [&](int) { pool.interrupt(); });
 */
class SignalWatcher {
public:
    using Handler = std::function<void(int)>;

    /**
     * @throws std::system_error if the signal mask cannot be changed or the
     *         thread cannot be started
     */
    SignalWatcher(std::initializer_list<int> signals, Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /**
     * Block signals in the calling thread; threads it starts inherit the mask.
     * @throws std::system_error if the signal mask cannot be changed
     */
    static void blockSignals(std::initializer_list<int> signals);

    /**
     * Stop and join the watcher thread. The signals stay blocked.
     */
    void stop();

private:
    void run();

    sigset_t set_;
    Handler handler_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

} // namespace blat
