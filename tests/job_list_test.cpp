#include <gtest/gtest.h>
#include "blat/threading/JobList.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace blat;

namespace {

JobPtr makeJob() {
    return std::make_shared<Job>([](RequestExecutor&) {});
}

} // namespace

TEST(JobListTest, EmptyListReturnsNull) {
    JobList list;
    EXPECT_EQ(list.next(), nullptr);
    EXPECT_EQ(list.size(), 0u);
}

TEST(JobListTest, PreservesOrder) {
    auto a = makeJob();
    auto b = makeJob();
    auto c = makeJob();
    JobList list({a, b});
    list.push(c);

    EXPECT_EQ(list.size(), 3u);
    EXPECT_EQ(list.next(), a);
    EXPECT_EQ(list.next(), b);
    EXPECT_EQ(list.next(), c);
    EXPECT_EQ(list.next(), nullptr);
}

TEST(JobListTest, DispatcherPullsFromList) {
    auto a = makeJob();
    JobList list({a});
    Dispatcher dispatch = list.dispatcher();

    EXPECT_EQ(dispatch(), a);
    EXPECT_EQ(dispatch(), nullptr);
}

TEST(JobListTest, ConcurrentDispatchHandsOutEachJobOnce) {
    std::vector<JobPtr> jobs;
    for (int i = 0; i < 500; ++i) {
        jobs.push_back(makeJob());
    }
    JobList list(jobs);
    Dispatcher dispatch = list.dispatcher();

    std::mutex seen_mutex;
    std::set<Job*> seen;
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            while (JobPtr job = dispatch()) {
                std::lock_guard<std::mutex> lock(seen_mutex);
                if (!seen.insert(job.get()).second) {
                    duplicates++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(duplicates.load(), 0);
    EXPECT_EQ(seen.size(), jobs.size());
}
