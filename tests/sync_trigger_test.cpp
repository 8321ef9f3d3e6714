#include <gtest/gtest.h>

#include "SyncTrigger.h"
#include "TestSupport.h"

namespace {

bool body_mentions(const HttpRequest& request, const std::string& file_name)
{
    return request.body.find("filename=\"" + file_name + "\"") != std::string::npos;
}

} // namespace

class SyncTriggerTest : public ::testing::Test {
protected:
    explicit SyncTriggerTest(const PipelineConfig& config = make_config())
        : p(config),
          sync(*p.queue, *p.coordinator, *p.scheduler, p.classifier, p.connectivity, p.loop,
               p.config) {}

    std::string add(const std::string& file_name)
    {
        std::string id;
        PipelineError error;
        EXPECT_TRUE(p.queue->add(make_record(file_name, 2048), id, error)) << error.to_string();
        return id;
    }

    SubmissionRecord load(const std::string& id)
    {
        SubmissionRecord record;
        PipelineError error;
        EXPECT_TRUE(p.queue->get(id, record, error)) << error.to_string();
        return record;
    }

    void accept_all()
    {
        p.transport.set_handler([](const HttpRequest&) { return http_response(200, {}, "{}"); });
    }

    TestPipeline p;
    SyncTrigger sync;
};

TEST_F(SyncTriggerTest, NonRetryableErrorStopsThePass)
{
    std::string first = add("one.webm");
    std::string second = add("two.webm");
    std::string third = add("three.webm");
    p.transport.set_handler([](const HttpRequest& request) {
        return body_mentions(request, "one.webm") ? http_response(400) : http_response(200, {}, "{}");
    });

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();

    EXPECT_FALSE(sync.is_flushing());
    EXPECT_EQ(1u, p.transport.requests.size());
    EXPECT_EQ(RECORD_FAILED, load(first).status);
    EXPECT_EQ(RECORD_PENDING, load(second).status);
    EXPECT_EQ(RECORD_PENDING, load(third).status);
    EXPECT_EQ(0, load(second).retry_count);
    EXPECT_EQ(0, load(third).retry_count);

    const FlushSummary& summary = sync.get_last_summary();
    EXPECT_EQ(1, summary.halted);
    EXPECT_EQ(0, summary.uploaded);
    EXPECT_NE(std::string::npos, summary.stop_reason.find(first));

    // The next trigger skips the halted record and drains the rest
    ASSERT_TRUE(sync.flush_now("again"));
    p.loop.run_until_idle();
    EXPECT_EQ(2, sync.get_last_summary().uploaded);
    EXPECT_EQ(1, sync.get_last_summary().skipped);
    EXPECT_TRUE(p.queue->contains(first));
    EXPECT_FALSE(p.queue->contains(second));
    EXPECT_FALSE(p.queue->contains(third));
}

TEST_F(SyncTriggerTest, SuccessfulUploadsLeaveTheQueue)
{
    add("one.webm");
    add("two.webm");
    accept_all();

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();

    EXPECT_EQ(2, sync.get_last_summary().uploaded);
    EXPECT_EQ(0, p.queue->pending_count());
    ASSERT_EQ(2u, p.transport.requests.size());

    // Strictly sequential, in creation order
    EXPECT_TRUE(body_mentions(p.transport.requests[0], "one.webm"));
    EXPECT_TRUE(body_mentions(p.transport.requests[1], "two.webm"));
}

TEST_F(SyncTriggerTest, OnlyOnePassAtATime)
{
    add("one.webm");
    accept_all();

    ASSERT_TRUE(sync.flush_now("first"));
    EXPECT_TRUE(sync.is_flushing());
    EXPECT_FALSE(sync.flush_now("second"));

    p.loop.run_until_idle();
    EXPECT_FALSE(sync.is_flushing());
    EXPECT_EQ(1, sync.get_pass_count());
    EXPECT_EQ(1u, p.transport.requests.size());
}

TEST_F(SyncTriggerTest, OfflineSkipsThePass)
{
    add("one.webm");
    p.connectivity.set_online(false);

    EXPECT_FALSE(sync.flush_now("test"));
    EXPECT_EQ(0, sync.get_pass_count());
    EXPECT_TRUE(p.transport.requests.empty());
}

TEST_F(SyncTriggerTest, TransientFailuresAreRescheduled)
{
    std::string first = add("one.webm");
    std::string second = add("two.webm");
    p.transport.set_handler([](const HttpRequest&) { return http_response(503); });

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();

    EXPECT_EQ(2, sync.get_last_summary().rescheduled);
    EXPECT_EQ(1, load(first).retry_count);
    EXPECT_EQ(1, load(second).retry_count);
    EXPECT_EQ(RECORD_PENDING, load(first).status);
    EXPECT_EQ(p.clock.now_ms(), load(first).last_attempt_at);
    EXPECT_EQ("SERVER_5XX (HTTP 503): POST returned HTTP 503", load(first).last_error);
}

TEST_F(SyncTriggerTest, RecordsWaitForTheirDelay)
{
    std::string id = add("one.webm");
    PipelineError error;
    ASSERT_TRUE(p.queue->update_retry(id, 1, "HTTP 503", error));
    accept_all();

    ASSERT_TRUE(sync.flush_now("too early"));
    p.loop.run_until_idle();
    EXPECT_EQ(1, sync.get_last_summary().skipped);
    EXPECT_TRUE(p.transport.requests.empty());

    // Tier A, good link: the second attempt waits 5 s
    p.clock.advance(5000);
    ASSERT_TRUE(sync.flush_now("due"));
    p.loop.run_until_idle();
    EXPECT_EQ(1, sync.get_last_summary().uploaded);
    EXPECT_FALSE(p.queue->contains(id));
}

TEST_F(SyncTriggerTest, ExhaustedRecordsAreNotRetriedAutomatically)
{
    std::string id = add("one.webm");
    PipelineError error;
    ASSERT_TRUE(p.queue->update_retry(id, p.config.max_retries, "gave up", error));
    accept_all();
    p.clock.advance(24LL * 3600 * 1000);

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();
    EXPECT_EQ(1, sync.get_last_summary().skipped);
    EXPECT_TRUE(p.transport.requests.empty());
    EXPECT_TRUE(p.queue->contains(id));
}

TEST_F(SyncTriggerTest, ManualRetryIgnoresDelayAndCap)
{
    std::string id = add("one.webm");
    PipelineError error;
    ASSERT_TRUE(p.queue->update_retry(id, p.config.max_retries, "gave up", error));
    accept_all();

    ASSERT_TRUE(sync.retry_record(id, error)) << error.to_string();
    EXPECT_FALSE(sync.retry_record(id, error));
    EXPECT_EQ(ERR_REENTRANCY_GUARD, error.kind);

    p.loop.run_until_idle();
    EXPECT_FALSE(p.queue->contains(id));

    EXPECT_FALSE(sync.retry_record("sub-missing", error));
    EXPECT_EQ(ERR_VALIDATION, error.kind);
}

TEST_F(SyncTriggerTest, ManualRetryStillRespectsTheBreaker)
{
    std::string id = add("one.webm");
    for (int i = 0; i < p.config.breaker_threshold; i++) {
        p.scheduler->breaker().record_failure();
    }

    PipelineError error;
    EXPECT_FALSE(sync.retry_record(id, error));
    EXPECT_EQ(ERR_CIRCUIT_OPEN, error.kind);
    EXPECT_EQ(RECORD_PENDING, load(id).status);
    EXPECT_TRUE(p.transport.requests.empty());
}

TEST_F(SyncTriggerTest, ExpiredFailuresArePurgedBeforeAPass)
{
    std::string failed = add("bad.webm");
    PipelineError error;
    ASSERT_TRUE(p.queue->mark_status(failed, RECORD_FAILED, "HTTP 400", error));
    p.clock.advance((int64_t)(p.config.max_age_hours + 1) * 3600 * 1000);

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();
    EXPECT_FALSE(p.queue->contains(failed));
}

TEST_F(SyncTriggerTest, StartupAndPeriodicTimersTriggerPasses)
{
    add("one.webm");
    p.transport.set_handler([](const HttpRequest&) { return http_response(503); });
    std::vector<FlushSummary> passes;
    sync.set_pass_listener([&passes](const FlushSummary& s) { passes.push_back(s); });

    sync.start();
    EXPECT_TRUE(sync.is_running());

    drain_for(p.loop, p.clock, p.config.sync_startup_delay_ms);
    EXPECT_EQ(1, sync.get_pass_count());

    drain_for(p.loop, p.clock, (int64_t)p.config.sync_period_seconds * 1000);
    EXPECT_EQ(2, sync.get_pass_count());
    ASSERT_EQ(2u, passes.size());
    EXPECT_EQ(1, passes[1].rescheduled);

    sync.stop();
    EXPECT_FALSE(sync.is_running());
    EXPECT_EQ(0u, p.loop.pending_timers());
}

TEST_F(SyncTriggerTest, ConnectivityRestoreFlushesAndForgivesAFailure)
{
    add("one.webm");
    accept_all();
    p.scheduler->breaker().record_failure();
    p.scheduler->breaker().record_failure();

    sync.start();
    p.connectivity.set_online(false);
    p.connectivity.set_online(true);

    EXPECT_EQ(1, sync.get_pass_count());
    EXPECT_EQ(1, p.scheduler->breaker().get_failures());
    p.loop.run_until_idle();
    EXPECT_EQ(0, p.queue->pending_count());
    sync.stop();
}

class StrictBreakerSyncTest : public SyncTriggerTest {
protected:
    static PipelineConfig strict()
    {
        PipelineConfig config = make_config();
        config.breaker_threshold = 1;
        return config;
    }

    StrictBreakerSyncTest() : SyncTriggerTest(strict()) {}
};

TEST_F(StrictBreakerSyncTest, OpenBreakerPausesThePass)
{
    std::string first = add("one.webm");
    std::string second = add("two.webm");
    p.transport.set_handler([](const HttpRequest&) { return network_failure(); });

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();

    const FlushSummary& summary = sync.get_last_summary();
    EXPECT_TRUE(summary.paused);
    EXPECT_EQ(1, summary.rescheduled);
    EXPECT_EQ(1u, p.transport.requests.size());
    EXPECT_EQ(1, load(first).retry_count);
    EXPECT_EQ(0, load(second).retry_count);
    EXPECT_EQ(RECORD_PENDING, load(second).status);
}

class UnconfiguredSyncTest : public SyncTriggerTest {
protected:
    static PipelineConfig no_endpoints()
    {
        PipelineConfig config = make_config();
        config.resumable_endpoint.clear();
        config.direct_endpoint.clear();
        return config;
    }

    UnconfiguredSyncTest() : SyncTriggerTest(no_endpoints()) {}
};

TEST_F(UnconfiguredSyncTest, MissingEndpointLeavesRecordsPending)
{
    std::string first = add("one.webm");
    std::string second = add("two.webm");

    ASSERT_TRUE(sync.flush_now("test"));
    p.loop.run_until_idle();

    const FlushSummary& summary = sync.get_last_summary();
    EXPECT_TRUE(summary.paused);
    EXPECT_EQ(0, summary.halted);
    EXPECT_TRUE(p.transport.requests.empty());
    EXPECT_EQ(RECORD_PENDING, load(first).status);
    EXPECT_EQ(RECORD_PENDING, load(second).status);
    EXPECT_EQ(0, load(first).retry_count);
}

TEST_F(UnconfiguredSyncTest, ManualRetryWithoutEndpointStaysPending)
{
    std::string id = add("one.webm");

    PipelineError error;
    ASSERT_TRUE(sync.retry_record(id, error)) << error.to_string();
    p.loop.run_until_idle();

    SubmissionRecord record = load(id);
    EXPECT_EQ(RECORD_PENDING, record.status);
    EXPECT_NE(std::string::npos, record.last_error.find("CONFIGURATION"));
}
