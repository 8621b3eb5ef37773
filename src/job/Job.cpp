#include "blat/job/Job.hpp"
#include "blat/Errors.hpp"

#include <stdexcept>
#include <utility>

namespace blat {

ResponseProperties ResponseProperties::fromTransferInfo(const TransferInfo& info, bool truncated) {
    ResponseProperties props;
    props.round_trip_time = info.total_time;
    props.redirect_time = info.redirect_time;
    props.dns_lookup_time = info.name_lookup_time;
    props.effective_uri = info.effective_url;
    props.code = info.response_code;
    props.download_speed = info.download_speed;
    props.downloaded_bytes = info.downloaded_bytes;
    props.truncated = truncated;
    return props;
}

Job::Job(Configurator configure, JobConfig config)
    : configure_(std::move(configure)), config_(std::move(config)) {
    if (!configure_) {
        throw ConfigurationError("No request configuration procedure given");
    }
}

std::shared_ptr<Job> Job::forUrl(const std::string& url, RequestSpec spec, JobConfig config) {
    spec.url = url;
    return std::make_shared<Job>(
        [spec = std::move(spec)](RequestExecutor& executor) { executor.configure(spec); },
        std::move(config));
}

void Job::configure(RequestExecutor& executor) const {
    configure_(executor);
}

void Job::finalize(Result result) {
    if (!state_.tryBeginFinalize()) {
        throw AlreadyFinalizedError();
    }
    result_ = std::move(result);
    state_.commit();
}

const Result& Job::result() const {
    if (!state_.isFinalized()) {
        throw std::logic_error("Job has not been finalized");
    }
    return *result_;
}

} // namespace blat
