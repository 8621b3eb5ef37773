#include "blat/threading/Worker.hpp"
#include "blat/Config.hpp"
#include "blat/Errors.hpp"
#include "blat/job/BodyCapture.hpp"
#include "blat/logger/Logger.hpp"
#include "blat/threading/Pool.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace blat {

Worker::Worker(std::size_t id, Pool& pool)
    : id_(id), pool_(pool) {}

void Worker::work(const Dispatcher& dispatcher) {
    // Start idle; the pool's table already says so
    bool last_idle = true;

    while (true) {
        try {
            checkInterrupt();

            JobPtr job;
            while (!killed() && (job = dispatcher())) {
                // If we were idle last, tell the pool
                if (last_idle) {
                    pool_.workerActive(id_);
                    last_idle = false;
                }

                BLAT_DEBUG_LOG("W" << id_ << ": Downloading job " << job.get());
                completeRequest(job);
                job.reset();

                checkInterrupt();
                if (abortRequested()) {
                    return;
                }
            }
            if (abortRequested()) {
                return;
            }
        } catch (const InterruptSignal&) {
            throw;
        } catch (const std::exception& e) {
            Logger::getInstance().logWarning("W" + std::to_string(id_) + ": Error: " + e.what());
        } catch (...) {
            Logger::getInstance().logCurrentError("W" + std::to_string(id_) + ": Error",
                                                  LogLevel::WARN);
        }

        // Out of work or failed; either way there is no job in hand. Waiting
        // here also keeps a failing dispatcher from spinning.
        pool_.workerIdle(id_);
        last_idle = true;
        waitIdle(pool_.idlePollInterval());
        if (abortRequested()) {
            return;
        }
    }
}

void Worker::close() {
    abort_.store(true, std::memory_order_release);
    wake();
}

void Worker::kill() {
    killed_.store(true, std::memory_order_release);
    wake();
}

void Worker::wake() {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_.notify_all();
}

void Worker::waitIdle(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, interval, [this] {
        return abortRequested() || pool_.interruptRequested();
    });
}

void Worker::checkInterrupt() const {
    if (pool_.interruptRequested() && !killed()) {
        throw InterruptSignal("W" + std::to_string(id_) + ": Interrupted");
    }
}

bool Worker::shouldCancel() const {
    return killed() || pool_.interruptRequested();
}

void Worker::completeRequest(const JobPtr& job) {
    // Somewhere to store the body in a size-aware way
    BodyCapture capture(job->config().max_body_size);

    std::shared_ptr<RequestExecutor> executor;
    std::optional<TransferError> error;
    TransferError::Stage stage = TransferError::Stage::CONFIGURE;

    try {
        executor = pool_.createExecutor();
        executor->setCancelCheck([this] { return shouldCancel(); });
        if (capture.limited()) {
            executor->setBodySink([&capture](std::string_view chunk) { return capture.append(chunk); });
        }
        job->configure(*executor);

        // The single blocking point per job
        stage = TransferError::Stage::PERFORM;
        executor->perform();
    } catch (const InterruptSignal&) {
        throw;
    } catch (const TransferError& e) {
        BLAT_DEBUG_LOG("W" << id_ << ": Job " << job.get() << ": " << e.what());
        error = e;
    } catch (const std::exception& e) {
        Logger::getInstance().logError("W" + std::to_string(id_) + ": Exception retrieving job: " + e.what());
        error.emplace(stage, 0, e.what());
    } catch (...) {
        Logger::getInstance().logCurrentError("W" + std::to_string(id_) +
                                              ": Unknown exception retrieving job");
        error.emplace(stage, 0, "unknown exception");
    }

    Result result;
    if (executor) {
        // Neither callback may outlive this frame
        executor->setBodySink(nullptr);
        executor->setCancelCheck(nullptr);

        result.head = executor->headerText();
        result.body = capture.limited() ? capture.take() : executor->bodyText();
        result.response_properties =
            ResponseProperties::fromTransferInfo(executor->info(), capture.truncated());
        if (capture.truncated()) {
            BLAT_DEBUG_LOG("W" << id_ << ": Job " << job.get() << " reached byte limit ("
                               << *job->config().max_body_size << "b)");
        }
    }
    result.response = std::move(executor);
    result.error = std::move(error);

    BLAT_DEBUG_LOG("W" << id_ << ": Completed request, response code "
                       << result.response_properties.code);

    job->finalize(std::move(result));
    pool_.workComplete(job);
}

} // namespace blat
