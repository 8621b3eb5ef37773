#pragma once

#include "blat/Errors.hpp"
#include "blat/http/RequestExecutor.hpp"

#include <curl/curl.h>
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace blat {

/**
 * RequestExecutor over one libcurl easy handle.
 *
 * The handle is created at construction with header, body and progress
 * callbacks already installed, so the same object can be driven either by
 * perform() (easy interface, one blocking transfer) or by a TransferQueue
 * (multi interface, see prepareTransfer()/completeTransfer()).
 *
 * Usage:
 *   auto exec = std::make_shared<CurlExecutor>();
 *   exec->configure(spec);
 *   exec->perform();                 // throws TransferError on failure
 *   auto code = exec->info().response_code;
 */
class CurlExecutor : public RequestExecutor {
public:
    CurlExecutor();
    ~CurlExecutor() override;

    // Non-copyable, non-movable (libcurl holds a pointer to this object)
    CurlExecutor(const CurlExecutor&) = delete;
    CurlExecutor& operator=(const CurlExecutor&) = delete;

    /**
     * Default ExecutorFactory for Pool.
     */
    static std::shared_ptr<RequestExecutor> create();

    /**
     * Process-wide libcurl initialisation, performed once.
     * @throws std::runtime_error if libcurl cannot be initialised
     */
    static void globalInit();

    void configure(const RequestSpec& spec) override;
    void setBodySink(BodySink sink) override;
    void setCancelCheck(CancelCheck check) override;
    void perform() override;

    const std::string& headerText() const override { return header_; }
    const std::string& bodyText() const override { return body_; }
    TransferInfo info() const override;

    /**
     * Raw easy handle for options RequestSpec does not cover.
     */
    CURL* nativeHandle() const { return curl_; }

    /**
     * Clear per-transfer state. Called by perform() and by TransferQueue
     * before the handle is added to a multi handle.
     */
    void prepareTransfer();

    /**
     * Record the outcome of a transfer driven elsewhere (multi interface).
     */
    void completeTransfer(CURLcode rc);

    CURLcode lastResult() const { return last_result_; }
    const std::optional<TransferError>& error() const { return error_; }
    bool cancelled() const { return cancelled_; }

private:
    static size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static int progressCallback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);
    static CURLcode sslContextCallback(CURL* curl, void* ssl_ctx, void* userdata);

    template <typename T>
    void setOption(CURLoption option, T value, const char* name);

    void applyMethod(const RequestSpec& spec);
    void applyHeaders(const RequestSpec& spec);

    CURL* curl_;
    struct curl_slist* headers_ = nullptr;
    std::optional<TlsOptions> tls_;

    std::string header_;
    std::string body_;
    char error_buffer_[CURL_ERROR_SIZE];

    BodySink sink_;
    bool sink_closed_ = false;
    CancelCheck cancel_check_;
    bool cancelled_ = false;
    std::exception_ptr callback_error_;

    CURLcode last_result_ = CURLE_OK;
    std::optional<TransferError> error_;
};

} // namespace blat
