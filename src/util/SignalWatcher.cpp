#include "blat/util/SignalWatcher.hpp"
#include "blat/logger/Logger.hpp"

#include <cerrno>
#include <exception>
#include <pthread.h>
#include <string>
#include <system_error>

namespace blat {

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, Handler handler)
    : handler_(std::move(handler)) {
    sigemptyset(&set_);
    for (int signo : signals) {
        sigaddset(&set_, signo);
    }
    // SIGUSR2 is used to wake the watcher on stop()
    sigaddset(&set_, SIGUSR2);

    int rc = pthread_sigmask(SIG_BLOCK, &set_, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask failed");
    }

    thread_ = std::thread([this]() { run(); });
}

void SignalWatcher::blockSignals(std::initializer_list<int> signals) {
    sigset_t set;
    sigemptyset(&set);
    for (int signo : signals) {
        sigaddset(&set, signo);
    }
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask failed");
    }
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) {
        return;
    }
    stopping_.store(true, std::memory_order_release);
    int rc = pthread_kill(thread_.native_handle(), SIGUSR2);
    if (rc != 0) {
        Logger::getInstance().logError("SignalWatcher: pthread_kill failed: " +
                                       std::error_code(rc, std::generic_category()).message());
    }
    thread_.join();
}

void SignalWatcher::run() {
    int signo = 0;
    while (!stopping_.load(std::memory_order_acquire)) {
        int rc = sigwait(&set_, &signo);
        if (rc != 0) {
            if (rc == EINTR) {
                continue;
            }
            Logger::getInstance().logError("SignalWatcher: sigwait failed: " +
                                           std::error_code(rc, std::generic_category()).message());
            return;
        }
        if (stopping_.load(std::memory_order_acquire)) {
            return;
        }
        if (signo == SIGUSR2) {
            continue;
        }

        Logger::getInstance().logMessage("Received signal " + std::to_string(signo));
        if (!handler_) {
            continue;
        }
        try {
            handler_(signo);
        } catch (const std::exception& e) {
            Logger::getInstance().logError(std::string("SignalWatcher: handler failed: ") + e.what());
        }
    }
}

} // namespace blat
