#include "blat/multi/TransferQueue.hpp"
#include "blat/Config.hpp"
#include "blat/logger/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace blat {

namespace {

constexpr int kPollTimeoutMs = 100;

// Clears the active flag however perform() exits
class ActivityGuard {
public:
    ActivityGuard(std::mutex& mutex, bool& active) : mutex_(mutex), active_(active) {}
    ~ActivityGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
    }

private:
    std::mutex& mutex_;
    bool& active_;
};

} // namespace

TransferQueue::TransferQueue(long max_connections, bool pipeline)
    : multi_(nullptr), max_connections_(max_connections > 0 ? max_connections : 0),
      pipeline_(pipeline) {
    CurlExecutor::globalInit();

    multi_ = curl_multi_init();
    if (!multi_) {
        throw std::runtime_error("Failed to create libcurl multi handle");
    }

    try {
        setMultiOption(CURLMOPT_MAXCONNECTS, max_connections_, "CURLMOPT_MAXCONNECTS");
        setMultiOption(CURLMOPT_PIPELINING, pipeline_ ? CURLPIPE_MULTIPLEX : CURLPIPE_NOTHING,
                       "CURLMOPT_PIPELINING");
    } catch (const std::runtime_error&) {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
        throw;
    }
}

TransferQueue::~TransferQueue() {
    if (background_.joinable()) {
        background_.join();
    }
    if (background_error_) {
        try {
            std::rethrow_exception(background_error_);
        } catch (const std::exception& e) {
            Logger::getInstance().logError(std::string("TransferQueue: Background run failed: ") + e.what());
        }
    }

    for (auto& [easy, entry] : entries_) {
        curl_multi_remove_handle(multi_, easy);
    }
    entries_.clear();

    if (multi_) {
        curl_multi_cleanup(multi_);
    }
}

void TransferQueue::setMultiOption(CURLMoption option, long value, const char* name) {
    CURLMcode rc = curl_multi_setopt(multi_, option, value);
    if (rc != CURLM_OK) {
        throw std::runtime_error(std::string("Failed to set ") + name + ": " + curl_multi_strerror(rc));
    }
}

std::shared_ptr<CurlExecutor> TransferQueue::add(const std::string& url, CompletionHandler on_complete) {
    auto request = std::make_shared<CurlExecutor>();
    RequestSpec spec;
    spec.url = url;
    request->configure(spec);
    return add(std::move(request), std::move(on_complete));
}

std::shared_ptr<CurlExecutor> TransferQueue::add(std::shared_ptr<CurlExecutor> request,
                                                 CompletionHandler on_complete) {
    if (!request) {
        throw std::invalid_argument("TransferQueue: Cannot add a null request");
    }

    CURL* easy = request->nativeHandle();
    if (entries_.count(easy) != 0) {
        throw std::logic_error("TransferQueue: Request is already queued");
    }

    request->prepareTransfer();
    CURLMcode rc = curl_multi_add_handle(multi_, easy);
    if (rc != CURLM_OK) {
        throw std::runtime_error(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(rc));
    }

    entries_.emplace(easy, Entry{request, std::move(on_complete)});
    return request;
}

void TransferQueue::cancel() {
    for (auto& [easy, entry] : entries_) {
        CURLMcode rc = curl_multi_remove_handle(multi_, easy);
        if (rc != CURLM_OK) {
            Logger::getInstance().logError(std::string("TransferQueue: Failed to cancel request: ") +
                                           curl_multi_strerror(rc));
        }
    }
    entries_.clear();
}

void TransferQueue::remove(const std::shared_ptr<CurlExecutor>& request) {
    if (!request) {
        return;
    }
    auto it = entries_.find(request->nativeHandle());
    if (it == entries_.end()) {
        return;
    }

    CURLMcode rc = curl_multi_remove_handle(multi_, it->first);
    entries_.erase(it);
    if (rc != CURLM_OK) {
        throw std::runtime_error(std::string("curl_multi_remove_handle failed: ") + curl_multi_strerror(rc));
    }
}

std::vector<std::shared_ptr<CurlExecutor>> TransferQueue::requests() const {
    std::vector<std::shared_ptr<CurlExecutor>> out;
    out.reserve(entries_.size());
    for (const auto& [easy, entry] : entries_) {
        out.push_back(entry.request);
    }
    return out;
}

bool TransferQueue::active() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return active_;
}

void TransferQueue::perform(TickHandler on_tick) {
    {
        std::lock_guard<std::mutex> lock(activity_mutex_);
        if (active_) {
            throw std::logic_error("Already actively performing requests");
        }
        active_ = true;
    }
    ActivityGuard guard(activity_mutex_, active_);

    while (true) {
        int running = 0;
        CURLMcode rc = curl_multi_perform(multi_, &running);
        if (rc != CURLM_OK) {
            throw std::runtime_error(std::string("curl_multi_perform failed: ") + curl_multi_strerror(rc));
        }

        drainFinished();

        if (on_tick) {
            on_tick();
        }

        if (entries_.empty()) {
            break;
        }

        rc = curl_multi_poll(multi_, nullptr, 0, kPollTimeoutMs, nullptr);
        if (rc != CURLM_OK) {
            throw std::runtime_error(std::string("curl_multi_poll failed: ") + curl_multi_strerror(rc));
        }
    }

    BLAT_DEBUG_LOG("TransferQueue: All requests finished");
}

void TransferQueue::performNonBlocking(TickHandler on_tick) {
    if (background_.joinable()) {
        throw std::logic_error("Currently active");
    }

    background_error_ = nullptr;
    background_ = std::thread([this, on_tick = std::move(on_tick)]() mutable {
        try {
            perform(std::move(on_tick));
        } catch (...) {
            // Handed to the owner by wait()
            background_error_ = std::current_exception();
        }
    });
}

void TransferQueue::wait() {
    if (background_.joinable()) {
        background_.join();
    }
    if (background_error_) {
        std::rethrow_exception(std::exchange(background_error_, nullptr));
    }
}

void TransferQueue::drainFinished() {
    CURLMsg* msg;
    int remaining = 0;

    while ((msg = curl_multi_info_read(multi_, &remaining)) != nullptr) {
        if (msg->msg != CURLMSG_DONE) {
            continue;
        }

        // msg is invalidated by curl_multi_remove_handle
        CURL* easy = msg->easy_handle;
        CURLcode result = msg->data.result;

        auto it = entries_.find(easy);
        if (it == entries_.end()) {
            continue;
        }
        Entry entry = std::move(it->second);
        entries_.erase(it);

        CURLMcode rc = curl_multi_remove_handle(multi_, easy);
        if (rc != CURLM_OK) {
            Logger::getInstance().logError(std::string("TransferQueue: Failed to remove finished request: ") +
                                           curl_multi_strerror(rc));
        }

        entry.request->completeTransfer(result);
        if (entry.on_complete) {
            entry.on_complete(*entry.request);
        }
    }
}

void ConsumingQueue::consume(Supplier supplier, long connections, CompletionHandler on_complete) {
    const std::size_t limit = static_cast<std::size_t>(connections > 0 ? connections
                                                       : (maxConnections() > 0 ? maxConnections() : 1));

    perform([&] {
        while (requestCount() < limit) {
            std::shared_ptr<CurlExecutor> request = supplier();
            if (!request) {
                break;
            }
            add(std::move(request), on_complete);
        }
    });
}

void ListConsumingQueue::consume(const std::vector<std::string>& urls, long connections,
                                 CompletionHandler on_complete) {
    const std::size_t limit = static_cast<std::size_t>(connections > 0 ? connections
                                                       : (maxConnections() > 0 ? maxConnections() : 1));
    std::size_t item = 0;

    perform([&] {
        while (requestCount() < limit && item < urls.size()) {
            add(urls[item], on_complete);
            ++item;
        }
    });
}

} // namespace blat
