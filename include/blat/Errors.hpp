#pragma once

#include <stdexcept>
#include <string>

namespace blat {

/**
 * A required collaborator was not supplied (finalize callback, dispatcher,
 * job configuration procedure). Thrown synchronously at the call site.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A Job was finalized twice. The first result is left untouched.
 */
class AlreadyFinalizedError : public std::logic_error {
public:
    AlreadyFinalizedError() : std::logic_error("Job is already finalized") {}
};

/**
 * Failure reported while configuring or performing a request.
 * Captured into the Job's Result, never thrown past a Worker.
 */
class TransferError : public std::runtime_error {
public:
    enum class Stage : int {
        CONFIGURE = 0,
        PERFORM = 1
    };

    TransferError(Stage stage, int code, const std::string& what)
        : std::runtime_error(what), stage_(stage), code_(code) {}

    Stage stage() const noexcept { return stage_; }

    // libcurl CURLcode, 0 when the failure did not come from libcurl
    int code() const noexcept { return code_; }

private:
    Stage stage_;
    int code_;
};

/**
 * Process-level interrupt (SIGINT/SIGTERM, forced kill). Never recovered:
 * escapes the Worker, kills the other workers and is rethrown to the owner.
 */
class InterruptSignal : public std::runtime_error {
public:
    explicit InterruptSignal(const std::string& what = "Interrupted") : std::runtime_error(what) {}
};

} // namespace blat
