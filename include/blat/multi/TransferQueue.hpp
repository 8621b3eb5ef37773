#pragma once

#include "blat/http/CurlExecutor.hpp"

#include <curl/curl.h>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace blat {

/**
 * Download queue over one libcurl multi handle: many transfers, one thread.
 *
 * Requests are CurlExecutors; each may carry a completion handler that runs
 * on the performing thread when its transfer finishes (successfully or not;
 * check CurlExecutor::error()).
 *
 * libcurl multi handles are not thread-safe: add(), remove(), cancel() and
 * requests() must be called either while the queue is not performing or from
 * the performing thread itself (inside a tick or completion handler).
 *
 * Usage:
 *   TransferQueue q(16);
 *   q.add("http://example.com/", [](CurlExecutor& c) { use(c.bodyText()); });
 *   q.perform([&] { report(q.requestCount()); });
 */
class TransferQueue {
public:
    using CompletionHandler = std::function<void(CurlExecutor&)>;
    using TickHandler = std::function<void()>;

    /**
     * @param max_connections Size of the connection cache (CURLMOPT_MAXCONNECTS)
     * @param pipeline Multiplex requests to the same server over one connection
     * @throws std::runtime_error if the multi handle cannot be created
     */
    explicit TransferQueue(long max_connections, bool pipeline = true);
    virtual ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    /**
     * Queue a GET for url.
     */
    std::shared_ptr<CurlExecutor> add(const std::string& url, CompletionHandler on_complete = {});

    /**
     * Queue an already configured request.
     */
    std::shared_ptr<CurlExecutor> add(std::shared_ptr<CurlExecutor> request,
                                      CompletionHandler on_complete = {});

    /**
     * Drop every queued or running request. Completion handlers do not run.
     */
    void cancel();

    /**
     * Drop one request. Not needed for requests that completed.
     */
    void remove(const std::shared_ptr<CurlExecutor>& request);

    std::size_t requestCount() const { return entries_.size(); }
    std::vector<std::shared_ptr<CurlExecutor>> requests() const;

    /**
     * Run until every request finished. on_tick runs once per loop iteration
     * and may add more requests.
     * @throws std::logic_error if the queue is already performing
     */
    void perform(TickHandler on_tick = {});

    /**
     * perform() on a background thread; wait() joins it.
     * @throws std::logic_error if a background run is still attached
     */
    void performNonBlocking(TickHandler on_tick = {});

    /**
     * Join the background run and rethrow whatever it threw.
     */
    void wait();

    // Is this object currently actively downloading data?
    bool active() const;

    // No request queued or running
    bool idle() const { return entries_.empty(); }

    long maxConnections() const { return max_connections_; }
    bool pipeline() const { return pipeline_; }

private:
    struct Entry {
        std::shared_ptr<CurlExecutor> request;
        CompletionHandler on_complete;
    };

    void drainFinished();
    void setMultiOption(CURLMoption option, long value, const char* name);

    CURLM* multi_;
    long max_connections_;
    bool pipeline_;

    std::unordered_map<CURL*, Entry> entries_;

    mutable std::mutex activity_mutex_;
    bool active_ = false;

    std::thread background_;
    std::exception_ptr background_error_;
};

/**
 * Keeps the queue full by pulling new requests from a supplier until it
 * returns nullptr and everything running has finished.
 */
class ConsumingQueue : public TransferQueue {
public:
    using Supplier = std::function<std::shared_ptr<CurlExecutor>()>;

    using TransferQueue::TransferQueue;

    /**
     * @param connections Requests in flight at once, 0 = maxConnections()
     */
    void consume(Supplier supplier, long connections = 0, CompletionHandler on_complete = {});
};

/**
 * Downloads every URL of a list with a bounded number in flight.
 */
class ListConsumingQueue : public TransferQueue {
public:
    using TransferQueue::TransferQueue;

    /**
     * @param connections Requests in flight at once, 0 = maxConnections()
     */
    void consume(const std::vector<std::string>& urls, long connections = 0,
                 CompletionHandler on_complete = {});
};

} // namespace blat
