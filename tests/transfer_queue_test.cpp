#include <gtest/gtest.h>
#include "blat/multi/Batch.hpp"
#include "blat/multi/TransferQueue.hpp"
#include "util/LoopbackHttpServer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace blat;
using blat::testing::LoopbackHttpServer;
namespace fs = std::filesystem;

class TransferQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "blat_transfer_queue_test";
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    // file:// URLs whose bodies are "body-<i>"
    std::vector<std::string> makeFiles(int count) {
        std::vector<std::string> urls;
        for (int i = 0; i < count; ++i) {
            fs::path path = test_dir_ / ("file-" + std::to_string(i) + ".txt");
            std::ofstream(path) << "body-" << i;
            urls.push_back("file://" + path.string());
        }
        return urls;
    }

    fs::path test_dir_;
};

TEST_F(TransferQueueTest, PerformRunsEveryRequest) {
    auto urls = makeFiles(5);
    TransferQueue queue(4);
    std::set<std::string> bodies;

    for (const auto& url : urls) {
        queue.add(url, [&bodies](CurlExecutor& request) { bodies.insert(request.bodyText()); });
    }
    EXPECT_EQ(queue.requestCount(), 5u);
    EXPECT_FALSE(queue.idle());

    queue.perform();

    EXPECT_TRUE(queue.idle());
    EXPECT_FALSE(queue.active());
    ASSERT_EQ(bodies.size(), 5u);
    EXPECT_TRUE(bodies.count("body-0"));
    EXPECT_TRUE(bodies.count("body-4"));
}

TEST_F(TransferQueueTest, FailedRequestCarriesError) {
    TransferQueue queue(2);
    bool completed = false;
    queue.add("file://" + (test_dir_ / "absent.txt").string(), [&completed](CurlExecutor& request) {
        completed = true;
        ASSERT_TRUE(request.error().has_value());
        EXPECT_EQ(request.error()->stage(), TransferError::Stage::PERFORM);
        EXPECT_NE(request.lastResult(), CURLE_OK);
    });

    queue.perform();
    EXPECT_TRUE(completed);
}

TEST_F(TransferQueueTest, HttpThroughMultiHandle) {
    LoopbackHttpServer server(LoopbackHttpServer::response(200, "OK", "over http"));
    TransferQueue queue(1);
    auto request = queue.add(server.url("/multi"));

    queue.perform();

    EXPECT_EQ(request->bodyText(), "over http");
    EXPECT_EQ(request->info().response_code, 200);
    EXPECT_FALSE(request->error().has_value());
}

TEST_F(TransferQueueTest, TickCanAddRequests) {
    auto urls = makeFiles(3);
    TransferQueue queue(2);
    std::size_t next = 0;
    int completed = 0;

    queue.perform([&]() {
        if (next < urls.size()) {
            queue.add(urls[next++], [&completed](CurlExecutor&) { ++completed; });
        }
    });

    EXPECT_EQ(completed, 3);
}

TEST_F(TransferQueueTest, CancelDropsRequestsWithoutCompletion) {
    auto urls = makeFiles(3);
    TransferQueue queue(2);
    int completed = 0;
    for (const auto& url : urls) {
        queue.add(url, [&completed](CurlExecutor&) { ++completed; });
    }

    queue.cancel();
    EXPECT_TRUE(queue.idle());
    queue.perform();
    EXPECT_EQ(completed, 0);
}

TEST_F(TransferQueueTest, RemoveDropsOneRequest) {
    auto urls = makeFiles(2);
    TransferQueue queue(2);
    auto first = queue.add(urls[0]);
    auto second = queue.add(urls[1]);

    queue.remove(first);
    EXPECT_EQ(queue.requestCount(), 1u);
    ASSERT_EQ(queue.requests().size(), 1u);
    EXPECT_EQ(queue.requests()[0], second);

    queue.perform();
    EXPECT_EQ(second->bodyText(), "body-1");
}

TEST_F(TransferQueueTest, AddingSameRequestTwiceThrows) {
    auto urls = makeFiles(1);
    TransferQueue queue(1);
    auto request = queue.add(urls[0]);
    EXPECT_THROW(queue.add(request), std::logic_error);
    EXPECT_THROW(queue.add(std::shared_ptr<CurlExecutor>{}), std::invalid_argument);
}

TEST_F(TransferQueueTest, PerformFromTickThrows) {
    auto urls = makeFiles(1);
    TransferQueue queue(1);
    queue.add(urls[0]);

    bool threw = false;
    queue.perform([&]() {
        if (!threw) {
            EXPECT_TRUE(queue.active());
            EXPECT_THROW(queue.perform(), std::logic_error);
            threw = true;
        }
    });
    EXPECT_TRUE(threw);
}

TEST_F(TransferQueueTest, NonBlockingPerformAndWait) {
    auto urls = makeFiles(4);
    TransferQueue queue(2);
    for (const auto& url : urls) {
        queue.add(url);
    }

    queue.performNonBlocking();
    EXPECT_THROW(queue.performNonBlocking(), std::logic_error);
    queue.wait();

    EXPECT_TRUE(queue.idle());
    EXPECT_FALSE(queue.active());
}

TEST_F(TransferQueueTest, OptionsAreKept) {
    TransferQueue queue(7, false);
    EXPECT_EQ(queue.maxConnections(), 7);
    EXPECT_FALSE(queue.pipeline());
}

TEST_F(TransferQueueTest, ListConsumingQueueBoundsInFlight) {
    auto urls = makeFiles(10);
    ListConsumingQueue queue(8);
    std::size_t max_in_flight = 0;
    std::set<std::string> bodies;

    queue.consume(urls, 3, [&](CurlExecutor& request) {
        bodies.insert(request.bodyText());
        max_in_flight = std::max(max_in_flight, queue.requestCount() + 1);
    });

    EXPECT_EQ(bodies.size(), 10u);
    EXPECT_LE(max_in_flight, 3u);
    EXPECT_TRUE(queue.idle());
}

TEST_F(TransferQueueTest, ConsumingQueuePullsUntilSupplierIsEmpty) {
    auto urls = makeFiles(6);
    ConsumingQueue queue(2);
    std::size_t next = 0;
    int completed = 0;

    queue.consume(
        [&]() -> std::shared_ptr<CurlExecutor> {
            if (next >= urls.size()) {
                return nullptr;
            }
            auto request = std::make_shared<CurlExecutor>();
            RequestSpec spec;
            spec.url = urls[next++];
            request->configure(spec);
            return request;
        },
        0, [&completed](CurlExecutor&) { ++completed; });

    EXPECT_EQ(completed, 6);
}

TEST_F(TransferQueueTest, BatchReturnsRequestsInOrder) {
    auto urls = makeFiles(5);
    int configured = 0;

    auto requests = Batch::run(3, urls, true, [&configured](CurlExecutor&) { ++configured; });

    EXPECT_EQ(configured, 5);
    ASSERT_EQ(requests.size(), urls.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        EXPECT_EQ(requests[i]->bodyText(), "body-" + std::to_string(i));
        EXPECT_FALSE(requests[i]->error().has_value());
    }
}
