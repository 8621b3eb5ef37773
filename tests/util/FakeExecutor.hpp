#pragma once

#include "blat/Errors.hpp"
#include "blat/http/RequestExecutor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace blat::testing {

/**
 * Scripted RequestExecutor: "receives" a header and a list of body chunks,
 * optionally fails after delivering them, optionally blocks until cancelled.
 */
class FakeExecutor : public RequestExecutor {
public:
    struct Script {
        std::string header = "HTTP/1.1 200 OK\r\n\r\n";
        std::vector<std::string> chunks;
        long response_code = 200;
        std::optional<TransferError> fail_after_body;
        bool fail_configure = false;
        // Keep "transferring" until the cancel check fires
        bool block_until_cancelled = false;
        std::chrono::milliseconds delay{0};
    };

    explicit FakeExecutor(Script script) : script_(std::move(script)) {}

    void configure(const RequestSpec& spec) override {
        if (script_.fail_configure) {
            throw TransferError(TransferError::Stage::CONFIGURE, 3, "Bad request options");
        }
        url_ = spec.url;
    }

    void setBodySink(BodySink sink) override { sink_ = std::move(sink); }
    void setCancelCheck(CancelCheck check) override { cancel_ = std::move(check); }

    void perform() override {
        if (script_.delay.count() > 0) {
            std::this_thread::sleep_for(script_.delay);
        }
        header_ = script_.header;
        bool sink_open = true;
        for (const auto& chunk : script_.chunks) {
            if (cancel_ && cancel_()) {
                throw InterruptSignal("Transfer aborted");
            }
            if (sink_ && sink_open) {
                sink_open = sink_(chunk) == chunk.size();
            } else if (!sink_) {
                body_ += chunk;
            }
            bytes_ += chunk.size();
        }
        while (script_.block_until_cancelled) {
            if (cancel_ && cancel_()) {
                throw InterruptSignal("Transfer aborted");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (script_.fail_after_body) {
            throw *script_.fail_after_body;
        }
    }

    const std::string& headerText() const override { return header_; }
    const std::string& bodyText() const override { return body_; }

    TransferInfo info() const override {
        TransferInfo info;
        info.effective_url = url_;
        info.response_code = header_.empty() ? 0 : script_.response_code;
        info.downloaded_bytes = bytes_;
        return info;
    }

    const BodySink& sink() const { return sink_; }
    const CancelCheck& cancelCheck() const { return cancel_; }

private:
    Script script_;
    std::string url_;
    std::string header_;
    std::string body_;
    std::uint64_t bytes_ = 0;
    BodySink sink_;
    CancelCheck cancel_;
};

/**
 * Factory returning a FakeExecutor per job and counting how many it built.
 */
inline ExecutorFactory fakeFactory(FakeExecutor::Script script,
                                   std::shared_ptr<std::atomic<int>> created = nullptr) {
    return [script, created]() -> std::shared_ptr<RequestExecutor> {
        if (created) {
            created->fetch_add(1);
        }
        return std::make_shared<FakeExecutor>(script);
    };
}

} // namespace blat::testing
