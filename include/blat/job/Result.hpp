#pragma once

#include "blat/Errors.hpp"
#include "blat/http/RequestExecutor.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace blat {

struct ResponseProperties {
    double round_trip_time = 0.0;
    double redirect_time = 0.0;
    double dns_lookup_time = 0.0;
    std::string effective_uri;
    long code = 0;
    double download_speed = 0.0;
    std::uint64_t downloaded_bytes = 0;
    bool truncated = false;

    static ResponseProperties fromTransferInfo(const TransferInfo& info, bool truncated);
};

/**
 * Outcome of one job. A present error marks the job as failed; head and body
 * still hold whatever arrived before the failure.
 */
struct Result {
    std::string head;
    std::string body;
    ResponseProperties response_properties;
    std::shared_ptr<RequestExecutor> response;
    std::optional<TransferError> error;

    bool ok() const { return !error.has_value(); }
};

} // namespace blat
