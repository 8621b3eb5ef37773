#include "blat/http/CurlExecutor.hpp"
#include "blat/http/TlsContextHelper.hpp"
#include "blat/logger/Logger.hpp"
#include "blat/Config.hpp"

#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace blat {

namespace {

constexpr double kMicrosPerSecond = 1000000.0;

std::once_flag g_curl_init_flag;

} // namespace

void CurlExecutor::globalInit() {
    std::call_once(g_curl_init_flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl: " +
                                     std::string(curl_easy_strerror(rc)));
        }
    });
}

std::shared_ptr<RequestExecutor> CurlExecutor::create() {
    return std::make_shared<CurlExecutor>();
}

CurlExecutor::CurlExecutor() : curl_(nullptr) {
    globalInit();

    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to create libcurl easy handle");
    }
    error_buffer_[0] = '\0';

    try {
        setOption(CURLOPT_ERRORBUFFER, error_buffer_, "CURLOPT_ERRORBUFFER");
        setOption(CURLOPT_HEADERFUNCTION, &CurlExecutor::headerCallback, "CURLOPT_HEADERFUNCTION");
        setOption(CURLOPT_HEADERDATA, static_cast<void*>(this), "CURLOPT_HEADERDATA");
        setOption(CURLOPT_WRITEFUNCTION, &CurlExecutor::writeCallback, "CURLOPT_WRITEFUNCTION");
        setOption(CURLOPT_WRITEDATA, static_cast<void*>(this), "CURLOPT_WRITEDATA");
        setOption(CURLOPT_XFERINFOFUNCTION, &CurlExecutor::progressCallback, "CURLOPT_XFERINFOFUNCTION");
        setOption(CURLOPT_XFERINFODATA, static_cast<void*>(this), "CURLOPT_XFERINFODATA");
        setOption(CURLOPT_NOPROGRESS, 0L, "CURLOPT_NOPROGRESS");
        // Workers are threads; libcurl must not use signals for DNS timeouts
        setOption(CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL");
        setOption(CURLOPT_PRIVATE, static_cast<void*>(this), "CURLOPT_PRIVATE");
    } catch (const TransferError&) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        throw;
    }
}

CurlExecutor::~CurlExecutor() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    if (headers_) {
        curl_slist_free_all(headers_);
    }
}

template <typename T>
void CurlExecutor::setOption(CURLoption option, T value, const char* name) {
    CURLcode rc = curl_easy_setopt(curl_, option, value);
    if (rc != CURLE_OK) {
        throw TransferError(TransferError::Stage::CONFIGURE, static_cast<int>(rc),
                            std::string("Failed to set ") + name + ": " + curl_easy_strerror(rc));
    }
}

void CurlExecutor::configure(const RequestSpec& spec) {
    if (spec.url.empty()) {
        throw TransferError(TransferError::Stage::CONFIGURE, static_cast<int>(CURLE_URL_MALFORMAT),
                            "No URL given");
    }

    setOption(CURLOPT_URL, spec.url.c_str(), "CURLOPT_URL");
    applyMethod(spec);
    applyHeaders(spec);

    setOption(CURLOPT_FOLLOWLOCATION, spec.follow_location ? 1L : 0L, "CURLOPT_FOLLOWLOCATION");
    setOption(CURLOPT_MAXREDIRS, spec.max_redirects, "CURLOPT_MAXREDIRS");

    if (spec.connect_timeout.count() > 0) {
        setOption(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(spec.connect_timeout.count()),
                  "CURLOPT_CONNECTTIMEOUT_MS");
    }
    if (spec.timeout.count() > 0) {
        setOption(CURLOPT_TIMEOUT_MS, static_cast<long>(spec.timeout.count()), "CURLOPT_TIMEOUT_MS");
    }

    if (!spec.user_agent.empty()) {
        setOption(CURLOPT_USERAGENT, spec.user_agent.c_str(), "CURLOPT_USERAGENT");
    }

    setOption(CURLOPT_SSL_VERIFYPEER, spec.verify_peer ? 1L : 0L, "CURLOPT_SSL_VERIFYPEER");
    setOption(CURLOPT_SSL_VERIFYHOST, spec.verify_peer ? 2L : 0L, "CURLOPT_SSL_VERIFYHOST");

    tls_ = spec.tls;
    if (tls_) {
        setOption(CURLOPT_SSL_CTX_FUNCTION, &CurlExecutor::sslContextCallback, "CURLOPT_SSL_CTX_FUNCTION");
        setOption(CURLOPT_SSL_CTX_DATA, static_cast<void*>(this), "CURLOPT_SSL_CTX_DATA");
    }

    BLAT_DEBUG_LOG("CurlExecutor: Configured " << spec.method << " " << spec.url);
}

void CurlExecutor::applyMethod(const RequestSpec& spec) {
    const std::string& method = spec.method;

    if (method == "HEAD") {
        setOption(CURLOPT_NOBODY, 1L, "CURLOPT_NOBODY");
        return;
    }

    if (method == "GET" && !spec.body) {
        setOption(CURLOPT_HTTPGET, 1L, "CURLOPT_HTTPGET");
        return;
    }

    if (spec.body) {
        setOption(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(spec.body->size()),
                  "CURLOPT_POSTFIELDSIZE_LARGE");
        setOption(CURLOPT_COPYPOSTFIELDS, spec.body->c_str(), "CURLOPT_COPYPOSTFIELDS");
    }

    if (method != "POST") {
        setOption(CURLOPT_CUSTOMREQUEST, method.c_str(), "CURLOPT_CUSTOMREQUEST");
    } else if (!spec.body) {
        setOption(CURLOPT_POST, 1L, "CURLOPT_POST");
        setOption(CURLOPT_POSTFIELDSIZE, 0L, "CURLOPT_POSTFIELDSIZE");
    }
}

void CurlExecutor::applyHeaders(const RequestSpec& spec) {
    if (headers_) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }

    for (const auto& [name, value] : spec.headers) {
        std::string line = name + ": " + value;
        struct curl_slist* appended = curl_slist_append(headers_, line.c_str());
        if (!appended) {
            throw TransferError(TransferError::Stage::CONFIGURE, static_cast<int>(CURLE_OUT_OF_MEMORY),
                                "Failed to append request header " + name);
        }
        headers_ = appended;
    }

    setOption(CURLOPT_HTTPHEADER, headers_, "CURLOPT_HTTPHEADER");
}

void CurlExecutor::setBodySink(BodySink sink) {
    sink_ = std::move(sink);
}

void CurlExecutor::setCancelCheck(CancelCheck check) {
    cancel_check_ = std::move(check);
}

void CurlExecutor::prepareTransfer() {
    header_.clear();
    body_.clear();
    error_buffer_[0] = '\0';
    sink_closed_ = false;
    cancelled_ = false;
    callback_error_ = nullptr;
    last_result_ = CURLE_OK;
    error_.reset();
}

void CurlExecutor::completeTransfer(CURLcode rc) {
    last_result_ = rc;
    if (rc == CURLE_OK) {
        return;
    }

    std::string message = error_buffer_[0] != '\0' ? std::string(error_buffer_)
                                                   : std::string(curl_easy_strerror(rc));
    error_.emplace(TransferError::Stage::PERFORM, static_cast<int>(rc), message);
}

void CurlExecutor::perform() {
    prepareTransfer();

    CURLcode rc = curl_easy_perform(curl_);
    completeTransfer(rc);

    if (cancelled_) {
        throw InterruptSignal("Transfer cancelled");
    }
    if (callback_error_) {
        std::rethrow_exception(callback_error_);
    }
    if (error_) {
        throw *error_;
    }
}

TransferInfo CurlExecutor::info() const {
    TransferInfo info;

    curl_off_t micros = 0;
    if (curl_easy_getinfo(curl_, CURLINFO_TOTAL_TIME_T, &micros) == CURLE_OK) {
        info.total_time = static_cast<double>(micros) / kMicrosPerSecond;
    }
    micros = 0;
    if (curl_easy_getinfo(curl_, CURLINFO_REDIRECT_TIME_T, &micros) == CURLE_OK) {
        info.redirect_time = static_cast<double>(micros) / kMicrosPerSecond;
    }
    micros = 0;
    if (curl_easy_getinfo(curl_, CURLINFO_NAMELOOKUP_TIME_T, &micros) == CURLE_OK) {
        info.name_lookup_time = static_cast<double>(micros) / kMicrosPerSecond;
    }

    char* url = nullptr;
    if (curl_easy_getinfo(curl_, CURLINFO_EFFECTIVE_URL, &url) == CURLE_OK && url) {
        info.effective_url = url;
    }

    long code = 0;
    if (curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK) {
        info.response_code = code;
    }

    curl_off_t speed = 0;
    if (curl_easy_getinfo(curl_, CURLINFO_SPEED_DOWNLOAD_T, &speed) == CURLE_OK) {
        info.download_speed = static_cast<double>(speed);
    }

    curl_off_t downloaded = 0;
    if (curl_easy_getinfo(curl_, CURLINFO_SIZE_DOWNLOAD_T, &downloaded) == CURLE_OK && downloaded > 0) {
        info.downloaded_bytes = static_cast<std::uint64_t>(downloaded);
    }

    return info;
}

size_t CurlExecutor::headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlExecutor*>(userdata);
    size_t total = size * nmemb;
    try {
        self->header_.append(ptr, total);
    } catch (...) {
        self->callback_error_ = std::current_exception();
        return 0;
    }
    return total;
}

size_t CurlExecutor::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlExecutor*>(userdata);
    size_t total = size * nmemb;

    try {
        if (!self->sink_) {
            self->body_.append(ptr, total);
            return total;
        }

        // The sink asked for no more data: keep the transfer alive, drop the bytes
        if (self->sink_closed_) {
            return total;
        }

        size_t consumed = self->sink_(std::string_view(ptr, total));
        if (consumed < total) {
            self->sink_closed_ = true;
        }
    } catch (...) {
        self->callback_error_ = std::current_exception();
        return 0;
    }
    return total;
}

int CurlExecutor::progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<CurlExecutor*>(userdata);
    if (!self->cancel_check_) {
        return 0;
    }

    try {
        if (self->cancel_check_()) {
            self->cancelled_ = true;
            return 1;
        }
    } catch (...) {
        self->callback_error_ = std::current_exception();
        return 1;
    }
    return 0;
}

CURLcode CurlExecutor::sslContextCallback(CURL*, void* ssl_ctx, void* userdata) {
    auto* self = static_cast<CurlExecutor*>(userdata);
    if (!self->tls_) {
        return CURLE_OK;
    }
    if (!TlsContextHelper::configureClientContext(static_cast<SSL_CTX*>(ssl_ctx), *self->tls_)) {
        return CURLE_SSL_CERTPROBLEM;
    }
    return CURLE_OK;
}

} // namespace blat
