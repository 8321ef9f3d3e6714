#include <gtest/gtest.h>

#include "CircuitBreaker.h"
#include "TestSupport.h"

class CircuitBreakerTest : public ::testing::Test {
protected:
    CircuitBreakerTest() : breaker(clock, 5, 300000) {}

    void fail_times(int n)
    {
        for (int i = 0; i < n; i++) {
            ASSERT_TRUE(breaker.allow_request());
            breaker.record_failure();
        }
    }

    ManualClock clock;
    CircuitBreaker breaker;
};

TEST_F(CircuitBreakerTest, StartsClosed)
{
    EXPECT_EQ(BREAKER_CLOSED, breaker.get_state());
    EXPECT_TRUE(breaker.allow_request());
    EXPECT_EQ(0, breaker.ms_until_retry());
}

TEST_F(CircuitBreakerTest, OpensAfterThresholdConsecutiveFailures)
{
    fail_times(4);
    EXPECT_EQ(BREAKER_CLOSED, breaker.get_state());

    fail_times(1);
    EXPECT_EQ(BREAKER_OPEN, breaker.get_state());
    EXPECT_EQ(clock.now_ms(), breaker.get_opened_at());

    // Sixth call inside the window is refused
    clock.advance(299999);
    EXPECT_FALSE(breaker.allow_request());
    EXPECT_EQ(1, breaker.ms_until_retry());
}

TEST_F(CircuitBreakerTest, SuccessResetsTheFailureCount)
{
    fail_times(4);
    breaker.record_success();
    EXPECT_EQ(0, breaker.get_failures());

    fail_times(4);
    EXPECT_EQ(BREAKER_CLOSED, breaker.get_state());
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsExactlyOneTrial)
{
    fail_times(5);
    clock.advance(300000);

    EXPECT_TRUE(breaker.allow_request());
    EXPECT_EQ(BREAKER_HALF_OPEN, breaker.get_state());
    EXPECT_FALSE(breaker.allow_request());
    EXPECT_FALSE(breaker.allow_request());
}

TEST_F(CircuitBreakerTest, SuccessfulTrialCloses)
{
    fail_times(5);
    clock.advance(300000);
    ASSERT_TRUE(breaker.allow_request());

    breaker.record_success();
    EXPECT_EQ(BREAKER_CLOSED, breaker.get_state());
    EXPECT_EQ(0, breaker.get_failures());
    EXPECT_TRUE(breaker.allow_request());
}

TEST_F(CircuitBreakerTest, FailedTrialReopensWithFreshWindow)
{
    fail_times(5);
    clock.advance(300000);
    ASSERT_TRUE(breaker.allow_request());

    clock.advance(1000);
    breaker.record_failure();
    EXPECT_EQ(BREAKER_OPEN, breaker.get_state());
    EXPECT_EQ(clock.now_ms(), breaker.get_opened_at());
    EXPECT_EQ(300000, breaker.ms_until_retry());
    EXPECT_FALSE(breaker.allow_request());
}

TEST_F(CircuitBreakerTest, ConnectivityRestoreForgivesOneFailure)
{
    fail_times(4);
    breaker.on_connectivity_restored();
    EXPECT_EQ(3, breaker.get_failures());

    // Two more failures are now needed to open
    fail_times(1);
    EXPECT_EQ(BREAKER_CLOSED, breaker.get_state());
    fail_times(1);
    EXPECT_EQ(BREAKER_OPEN, breaker.get_state());
}

TEST_F(CircuitBreakerTest, ForgivenessNeverGoesNegative)
{
    breaker.on_connectivity_restored();
    EXPECT_EQ(0, breaker.get_failures());
}

TEST_F(CircuitBreakerTest, ResetCloses)
{
    fail_times(5);
    breaker.reset();
    EXPECT_EQ(BREAKER_CLOSED, breaker.get_state());
    EXPECT_EQ(0, breaker.get_failures());
    EXPECT_TRUE(breaker.allow_request());
}

TEST(CircuitBreaker, NonPositiveThresholdBecomesOne)
{
    ManualClock clock;
    CircuitBreaker breaker(clock, 0, 1000);
    EXPECT_EQ(1, breaker.get_threshold());
    breaker.record_failure();
    EXPECT_EQ(BREAKER_OPEN, breaker.get_state());
}
