#include <gtest/gtest.h>

#include "RetryScheduler.h"
#include "TestSupport.h"

TEST(RetryScheduler, BackoffDoublesUntilTheCap)
{
    EXPECT_EQ(1000, RetryScheduler::compute_backoff_ms(1000, 0, 8, 0.0, 0.0));
    EXPECT_EQ(2000, RetryScheduler::compute_backoff_ms(1000, 1, 8, 0.0, 0.0));
    EXPECT_EQ(8000, RetryScheduler::compute_backoff_ms(1000, 3, 8, 0.0, 0.0));
    EXPECT_EQ(8000, RetryScheduler::compute_backoff_ms(1000, 12, 8, 0.0, 0.0));
    EXPECT_EQ(8000, RetryScheduler::compute_backoff_ms(1000, 400, 8, 0.0, 0.0));
}

TEST(RetryScheduler, JitterScalesTheDelay)
{
    EXPECT_EQ(1050, RetryScheduler::compute_backoff_ms(1000, 0, 8, 0.1, 0.5));
    EXPECT_EQ(4400, RetryScheduler::compute_backoff_ms(1000, 2, 8, 0.1, 1.0));
}

class RetrySchedulerTest : public ::testing::Test {
protected:
    RetrySchedulerTest() : config(make_config()) {}

    RetryScheduler make(double r = 0.0)
    {
        return RetryScheduler(clock, config, [r]() { return r; });
    }

    ManualClock clock;
    PipelineConfig config;
};

TEST_F(RetrySchedulerTest, LiveBackoffUsesConfiguredBase)
{
    config.base_delay_ms = 500;
    config.cap_multiplier = 4;
    RetryScheduler scheduler = make();
    EXPECT_EQ(500, scheduler.backoff_delay_ms(0));
    EXPECT_EQ(2000, scheduler.backoff_delay_ms(5));
}

TEST_F(RetrySchedulerTest, DelayTablesFollowTierAndQuality)
{
    RetryScheduler scheduler = make();

    std::vector<int64_t> normal = scheduler.flush_delays(TIER_A, QUALITY_HIGH);
    ASSERT_EQ(10u, normal.size());
    EXPECT_EQ(5000, normal[1]);

    std::vector<int64_t> slow = scheduler.flush_delays(TIER_C, QUALITY_HIGH);
    ASSERT_EQ(7u, slow.size());
    EXPECT_EQ(10000, slow[1]);
    EXPECT_EQ(slow, scheduler.flush_delays(TIER_A, QUALITY_VERY_LOW));

    // Past the end of the table the last entry repeats
    EXPECT_EQ(1800000, scheduler.delay_for_retry(50, TIER_A, QUALITY_HIGH));
    EXPECT_EQ(600000, scheduler.delay_for_retry(50, TIER_C, QUALITY_LOW));
    EXPECT_EQ(0, scheduler.delay_for_retry(-1, TIER_A, QUALITY_HIGH));
}

TEST_F(RetrySchedulerTest, ConfiguredDelaysOverrideTheTables)
{
    config.retry_delays_ms = {0, 100, 200};
    RetryScheduler scheduler = make();
    EXPECT_EQ(100, scheduler.delay_for_retry(1, TIER_C, QUALITY_VERY_LOW));
    EXPECT_EQ(200, scheduler.delay_for_retry(9, TIER_A, QUALITY_HIGH));
}

TEST_F(RetrySchedulerTest, DueWhenDelaySinceLastAttemptHasPassed)
{
    RetryScheduler scheduler = make();

    SubmissionRecord record;
    record.status = RECORD_PENDING;
    EXPECT_TRUE(scheduler.is_due(record, TIER_A, QUALITY_HIGH));

    record.retry_count = 2;
    record.last_attempt_at = clock.now_ms();
    EXPECT_FALSE(scheduler.is_due(record, TIER_A, QUALITY_HIGH));

    clock.advance(9999);
    EXPECT_FALSE(scheduler.is_due(record, TIER_A, QUALITY_HIGH));
    clock.advance(1);
    EXPECT_TRUE(scheduler.is_due(record, TIER_A, QUALITY_HIGH));

    // Slow table for tier C needs 30 s at retry 2
    EXPECT_FALSE(scheduler.is_due(record, TIER_C, QUALITY_HIGH));
}

TEST_F(RetrySchedulerTest, ExhaustedOrNonPendingIsNeverDue)
{
    RetryScheduler scheduler = make();

    QueueEntrySummary entry;
    entry.retry_count = config.max_retries;
    EXPECT_FALSE(scheduler.is_due(entry, TIER_A, QUALITY_HIGH));

    entry.retry_count = 0;
    entry.status = RECORD_FAILED;
    EXPECT_FALSE(scheduler.is_due(entry, TIER_A, QUALITY_HIGH));

    entry.status = RECORD_UPLOADING;
    EXPECT_FALSE(scheduler.is_due(entry, TIER_A, QUALITY_HIGH));
}

TEST_F(RetrySchedulerTest, ClassifyDecisions)
{
    RetryScheduler scheduler = make();
    std::string reason;

    EXPECT_EQ(DECISION_RETRY, scheduler.classify(PipelineError(ERR_NETWORK, "down"), reason));
    EXPECT_EQ(DECISION_RETRY, scheduler.classify(PipelineError(ERR_SERVER_5XX, "", 502), reason));
    EXPECT_EQ(DECISION_HALT, scheduler.classify(PipelineError(ERR_SERVER_4XX, "", 400), reason));
    EXPECT_EQ(DECISION_HALT, scheduler.classify(PipelineError(ERR_STORAGE_QUOTA, ""), reason));
    EXPECT_EQ(DECISION_HALT, scheduler.classify(PipelineError(ERR_MALFORMED_RESPONSE, ""), reason));
    EXPECT_EQ(DECISION_PAUSE, scheduler.classify(PipelineError(ERR_CIRCUIT_OPEN, ""), reason));
    EXPECT_EQ(DECISION_PAUSE, scheduler.classify(PipelineError(ERR_CONFIGURATION, "no endpoint"), reason));
    EXPECT_EQ(DECISION_HALT, scheduler.classify(PipelineError(ERR_VALIDATION, ""), reason));
    EXPECT_NE(std::string::npos, reason.find("Circuit open"));
}

TEST_F(RetrySchedulerTest, BreakerUsesConfiguredThreshold)
{
    config.breaker_threshold = 2;
    config.breaker_timeout_ms = 1000;
    RetryScheduler scheduler = make();

    scheduler.breaker().record_failure();
    scheduler.breaker().record_failure();
    EXPECT_EQ(BREAKER_OPEN, scheduler.breaker().get_state());
    EXPECT_EQ(1000, scheduler.breaker().ms_until_retry());
}
