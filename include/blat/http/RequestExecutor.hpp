#pragma once

#include "blat/http/RequestSpec.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace blat {

/**
 * Metadata readable after perform(), whether it succeeded or not. Fields the
 * transfer never reached keep their zero values.
 */
struct TransferInfo {
    double total_time = 0.0;        // seconds
    double redirect_time = 0.0;     // seconds
    double name_lookup_time = 0.0;  // seconds
    std::string effective_url;
    long response_code = 0;
    double download_speed = 0.0;    // bytes per second
    std::uint64_t downloaded_bytes = 0;
};

/**
 * Performs one configured HTTP transfer. Workers create a fresh executor per
 * job and hand it to Job::configure() before calling perform().
 *
 * Implementations are used by one thread at a time.
 */
class RequestExecutor {
public:
    /**
     * Receives each body chunk and returns the number of bytes consumed.
     * Returning less than chunk.size() stops further delivery without
     * aborting the transfer.
     */
    using BodySink = std::function<std::size_t(std::string_view chunk)>;

    /**
     * Polled while the transfer runs. Returning true aborts the transfer and
     * perform() throws InterruptSignal.
     */
    using CancelCheck = std::function<bool()>;

    virtual ~RequestExecutor() = default;

    virtual void configure(const RequestSpec& spec) = 0;
    virtual void setBodySink(BodySink sink) = 0;
    virtual void setCancelCheck(CancelCheck check) = 0;

    /**
     * Drive the transfer to completion. Blocks the calling thread.
     * @throws TransferError on transport failure
     * @throws InterruptSignal when the cancel check fired
     */
    virtual void perform() = 0;

    virtual const std::string& headerText() const = 0;

    // Only meaningful when no body sink was registered
    virtual const std::string& bodyText() const = 0;

    virtual TransferInfo info() const = 0;
};

using ExecutorFactory = std::function<std::shared_ptr<RequestExecutor>()>;

} // namespace blat
