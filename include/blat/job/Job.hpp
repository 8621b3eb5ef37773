#pragma once

#include "blat/http/RequestExecutor.hpp"
#include "blat/http/RequestSpec.hpp"
#include "blat/job/JobState.hpp"
#include "blat/job/Result.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace blat {

/**
 * Worker-level options carried by a job.
 */
struct JobConfig {
    // Cap on captured body bytes; unset means unlimited
    std::optional<std::size_t> max_body_size;

    // Free-form caller bookkeeping, never read by the pool
    std::map<std::string, std::string> attributes;
};

/**
 * One request plus its write-once result.
 *
 * The configuration procedure runs on the worker thread against the fresh
 * executor that will perform the request. The job is immutable apart from the
 * single finalize transition, which only the executing worker performs.
 */
class Job {
public:
    using Configurator = std::function<void(RequestExecutor&)>;

    /**
     * @throws ConfigurationError if configure is empty
     */
    explicit Job(Configurator configure, JobConfig config = {});

    /**
     * Job whose procedure applies a declarative RequestSpec with the given URL.
     */
    static std::shared_ptr<Job> forUrl(const std::string& url, RequestSpec spec = {},
                                       JobConfig config = {});

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    void configure(RequestExecutor& executor) const;

    /**
     * Store the result and prevent further editing.
     * @throws AlreadyFinalizedError if called more than once
     */
    void finalize(Result result);

    bool isFinalized() const { return state_.isFinalized(); }

    /**
     * @throws std::logic_error while the job is still pending
     */
    const Result& result() const;

    const JobConfig& config() const { return config_; }

private:
    Configurator configure_;
    JobConfig config_;
    JobState state_;
    std::optional<Result> result_;
};

using JobPtr = std::shared_ptr<Job>;

} // namespace blat
