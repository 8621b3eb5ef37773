#include <gtest/gtest.h>
#include "blat/Errors.hpp"
#include "blat/job/Job.hpp"
#include "util/FakeExecutor.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace blat;
using blat::testing::FakeExecutor;

namespace {

class RecordingExecutor : public FakeExecutor {
public:
    RecordingExecutor() : FakeExecutor(Script{}) {}

    void configure(const RequestSpec& spec) override {
        last_spec = spec;
        FakeExecutor::configure(spec);
    }

    RequestSpec last_spec;
};

Result resultWithBody(const std::string& body) {
    Result result;
    result.body = body;
    return result;
}

} // namespace

TEST(JobTest, RejectsEmptyConfigurator) {
    EXPECT_THROW(Job job(Job::Configurator{}), ConfigurationError);
}

TEST(JobTest, ResultBeforeFinalizeThrows) {
    Job job([](RequestExecutor&) {});
    EXPECT_FALSE(job.isFinalized());
    EXPECT_THROW(job.result(), std::logic_error);
}

TEST(JobTest, FinalizeStoresResult) {
    Job job([](RequestExecutor&) {});
    job.finalize(resultWithBody("payload"));

    EXPECT_TRUE(job.isFinalized());
    EXPECT_EQ(job.result().body, "payload");
    EXPECT_TRUE(job.result().ok());
}

TEST(JobTest, SecondFinalizeThrowsAndKeepsFirstResult) {
    Job job([](RequestExecutor&) {});
    job.finalize(resultWithBody("first"));

    EXPECT_THROW(job.finalize(resultWithBody("second")), AlreadyFinalizedError);
    EXPECT_EQ(job.result().body, "first");
}

TEST(JobTest, ConcurrentFinalizeExactlyOneWins) {
    Job job([](RequestExecutor&) {});
    std::atomic<int> wins{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            try {
                job.finalize(resultWithBody(std::to_string(i)));
                wins++;
            } catch (const AlreadyFinalizedError&) {
                rejected++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(rejected.load(), 7);
    EXPECT_TRUE(job.isFinalized());
}

TEST(JobTest, ConfigureRunsProcedureAgainstExecutor) {
    int calls = 0;
    Job job([&calls](RequestExecutor& executor) {
        ++calls;
        RequestSpec spec;
        spec.url = "http://example.invalid/";
        executor.configure(spec);
    });

    RecordingExecutor executor;
    job.configure(executor);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor.last_spec.url, "http://example.invalid/");
}

TEST(JobTest, ConfigureErrorPropagates) {
    Job job([](RequestExecutor&) {
        throw TransferError(TransferError::Stage::CONFIGURE, 0, "bad options");
    });
    RecordingExecutor executor;
    EXPECT_THROW(job.configure(executor), TransferError);
}

TEST(JobTest, ForUrlAppliesSpecWithUrl) {
    RequestSpec spec;
    spec.method = "HEAD";
    spec.headers.emplace_back("Accept", "text/plain");
    JobConfig config;
    config.max_body_size = 64;
    config.attributes["id"] = "7";

    auto job = Job::forUrl("http://example.invalid/a", spec, config);
    ASSERT_TRUE(job);
    ASSERT_TRUE(job->config().max_body_size.has_value());
    EXPECT_EQ(*job->config().max_body_size, 64u);
    EXPECT_EQ(job->config().attributes.at("id"), "7");

    RecordingExecutor executor;
    job->configure(executor);
    EXPECT_EQ(executor.last_spec.url, "http://example.invalid/a");
    EXPECT_EQ(executor.last_spec.method, "HEAD");
    ASSERT_EQ(executor.last_spec.headers.size(), 1u);
    EXPECT_EQ(executor.last_spec.headers[0].first, "Accept");
}

TEST(JobTest, ResponsePropertiesFromTransferInfo) {
    TransferInfo info;
    info.total_time = 1.5;
    info.redirect_time = 0.25;
    info.name_lookup_time = 0.125;
    info.effective_url = "http://example.invalid/final";
    info.response_code = 404;
    info.download_speed = 100.0;
    info.downloaded_bytes = 150;

    auto props = ResponseProperties::fromTransferInfo(info, true);
    EXPECT_DOUBLE_EQ(props.round_trip_time, 1.5);
    EXPECT_DOUBLE_EQ(props.redirect_time, 0.25);
    EXPECT_DOUBLE_EQ(props.dns_lookup_time, 0.125);
    EXPECT_EQ(props.effective_uri, "http://example.invalid/final");
    EXPECT_EQ(props.code, 404);
    EXPECT_DOUBLE_EQ(props.download_speed, 100.0);
    EXPECT_EQ(props.downloaded_bytes, 150u);
    EXPECT_TRUE(props.truncated);
}
