#include <gtest/gtest.h>

#include "EventBus.h"
#include "UploadCoordinator.h"
#include "TestSupport.h"

namespace {

UploadRequest small_request(const std::string& id)
{
    UploadRequest request;
    request.submission_id = id;
    request.instance_id = "instance-1";
    request.file_name = id + ".webm";
    request.mime_type = "audio/webm";
    request.payload = make_payload(1024);
    return request;
}

} // namespace

class UploadCoordinatorTest : public ::testing::Test {
protected:
    UploadCoordinatorTest() : paused_events(0), last_retry_in(0) {}

    void SetUp() override
    {
        p.bus.subscribe([this](const PipelineEvent& event) {
            if (event.type == EVENT_RETRIES_PAUSED) {
                paused_events++;
                last_retry_in = event.retry_in_ms;
                last_message = event.message;
            }
        });
    }

    bool start(const std::string& id, int attempts, std::vector<UploadResult>& results,
               PipelineError& error)
    {
        return p.coordinator->start(small_request(id), attempts, UploadProgressCallback(),
                                    [&results](const UploadResult& r) { results.push_back(r); },
                                    error);
    }

    TestPipeline p;
    int paused_events;
    int64_t last_retry_in;
    std::string last_message;
};

TEST_F(UploadCoordinatorTest, SecondStartForSameSubmissionIsRejected)
{
    p.transport.set_handler([](const HttpRequest&) { return http_response(200, {}, "{}"); });
    std::vector<UploadResult> results;
    PipelineError error;

    ASSERT_TRUE(start("sub-1", 1, results, error));
    EXPECT_TRUE(p.coordinator->is_in_flight("sub-1"));

    EXPECT_FALSE(start("sub-1", 1, results, error));
    EXPECT_EQ(ERR_REENTRANCY_GUARD, error.kind);

    p.drain_all();
    ASSERT_EQ(1u, results.size());
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(1u, p.transport.requests.size());
    EXPECT_FALSE(p.coordinator->is_in_flight("sub-1"));

    // Finished submissions may start again
    EXPECT_TRUE(start("sub-1", 1, results, error));
}

TEST_F(UploadCoordinatorTest, FiveFailuresOpenTheBreakerAndTheSixthCallDoesNoIo)
{
    std::vector<UploadResult> results;
    PipelineError error;
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(start("sub-" + std::to_string(i), 1, results, error));
        p.drain_all();
    }
    ASSERT_EQ(5u, results.size());
    EXPECT_EQ(ERR_NETWORK, results[4].error.kind);
    EXPECT_EQ(BREAKER_OPEN, p.scheduler->breaker().get_state());
    EXPECT_EQ(1, paused_events);

    p.clock.advance(60000);
    EXPECT_FALSE(start("sub-6", 1, results, error));
    EXPECT_EQ(ERR_CIRCUIT_OPEN, error.kind);
    EXPECT_EQ(5u, p.transport.requests.size());
    EXPECT_EQ(5u, results.size());
    EXPECT_EQ(2, paused_events);
    EXPECT_EQ(240000, last_retry_in);
    EXPECT_EQ("Retries paused, the server is not responding. Next attempt in 240 s", last_message);
}

TEST_F(UploadCoordinatorTest, TransientFailureIsRetriedLiveWithBackoff)
{
    int calls = 0;
    p.transport.set_handler([&calls](const HttpRequest&) {
        return ++calls == 1 ? http_response(503) : http_response(200, {}, "{\"url\":\"u\"}");
    });

    std::vector<UploadResult> results;
    PipelineError error;
    int64_t started = p.clock.now_ms();
    ASSERT_TRUE(start("sub-1", 2, results, error));
    p.drain_all();

    ASSERT_EQ(1u, results.size());
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ("u", results[0].url);
    EXPECT_EQ(2, calls);
    EXPECT_EQ(started + 1000, p.clock.now_ms());
    EXPECT_EQ(0, p.scheduler->breaker().get_failures());
}

TEST_F(UploadCoordinatorTest, LiveAttemptsAreBounded)
{
    std::vector<UploadResult> results;
    PipelineError error;
    ASSERT_TRUE(start("sub-1", 3, results, error));
    p.drain_all();

    ASSERT_EQ(1u, results.size());
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(3u, p.transport.requests.size());
    EXPECT_EQ(3, p.scheduler->breaker().get_failures());
}

TEST_F(UploadCoordinatorTest, ClientErrorIsNotRetriedAndDoesNotTripTheBreaker)
{
    p.transport.set_handler([](const HttpRequest&) { return http_response(400); });
    std::vector<UploadResult> results;
    PipelineError error;
    ASSERT_TRUE(start("sub-1", 3, results, error));
    p.drain_all();

    ASSERT_EQ(1u, results.size());
    EXPECT_EQ(ERR_SERVER_4XX, results[0].error.kind);
    EXPECT_EQ(1u, p.transport.requests.size());
    EXPECT_EQ(0, p.scheduler->breaker().get_failures());
}

TEST_F(UploadCoordinatorTest, BreakerOpeningStopsLiveRetries)
{
    PipelineConfig config = make_config();
    config.breaker_threshold = 1;
    TestPipeline strict(config);

    std::vector<UploadResult> results;
    PipelineError error;
    ASSERT_TRUE(strict.coordinator->start(small_request("sub-1"), 5, UploadProgressCallback(),
                                          [&results](const UploadResult& r) { results.push_back(r); },
                                          error));
    strict.drain_all();

    ASSERT_EQ(1u, results.size());
    EXPECT_EQ(1u, strict.transport.requests.size());
    EXPECT_EQ(BREAKER_OPEN, strict.scheduler->breaker().get_state());
}

TEST_F(UploadCoordinatorTest, HalfOpenTrialSuccessClosesTheBreaker)
{
    std::vector<UploadResult> results;
    PipelineError error;
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(start("sub-" + std::to_string(i), 1, results, error));
        p.drain_all();
    }
    ASSERT_EQ(BREAKER_OPEN, p.scheduler->breaker().get_state());

    p.clock.advance(300000);
    p.transport.set_handler([](const HttpRequest&) { return http_response(200, {}, "{}"); });
    ASSERT_TRUE(start("sub-trial", 1, results, error));

    // Only one trial while it is outstanding
    EXPECT_FALSE(start("sub-other", 1, results, error));
    EXPECT_EQ(ERR_CIRCUIT_OPEN, error.kind);

    p.drain_all();
    EXPECT_TRUE(results.back().success);
    EXPECT_EQ(BREAKER_CLOSED, p.scheduler->breaker().get_state());
}
