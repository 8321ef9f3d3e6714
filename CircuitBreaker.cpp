#include "CircuitBreaker.h"
#include "Clock.h"
#include "StateLogger.h"
#include "logger.h"

#include <algorithm>
#include <cstdio>

CircuitBreaker::CircuitBreaker(const Clock& clk, int failure_threshold, int64_t open_timeout_ms)
    : clock(clk),
      threshold(failure_threshold > 0 ? failure_threshold : 1),
      timeout_ms(open_timeout_ms),
      state(BREAKER_CLOSED),
      failures(0),
      opened_at(0),
      trial_in_flight(false)
{
}

CircuitBreaker::~CircuitBreaker()
{
}

void CircuitBreaker::transition_state(BreakerState new_state, const std::string& reason)
{
    if (new_state != state) {
        LOG_INFO_CTX("breaker", "STATE TRANSITION: %s -> %s | Reason: %s",
                     breaker_state_to_string(state),
                     breaker_state_to_string(new_state),
                     reason.c_str());

        LOG_STATE("BREAKER STATE: %s -> %s | %s",
                  breaker_state_to_string(state),
                  breaker_state_to_string(new_state),
                  reason.c_str());

        state = new_state;
    }
}

bool CircuitBreaker::allow_request()
{
    switch (state) {
        case BREAKER_CLOSED:
            return true;

        case BREAKER_OPEN:
            if (clock.now_ms() - opened_at < timeout_ms) {
                return false;
            }
            transition_state(BREAKER_HALF_OPEN, "Timeout elapsed, allowing one trial");
            trial_in_flight = true;
            return true;

        case BREAKER_HALF_OPEN:
            if (trial_in_flight) {
                return false;
            }
            trial_in_flight = true;
            return true;
    }
    return false;
}

void CircuitBreaker::record_success()
{
    trial_in_flight = false;
    failures = 0;
    if (state != BREAKER_CLOSED) {
        transition_state(BREAKER_CLOSED, "Request succeeded");
    }
}

void CircuitBreaker::record_failure()
{
    trial_in_flight = false;
    failures++;

    if (state == BREAKER_HALF_OPEN) {
        opened_at = clock.now_ms();
        transition_state(BREAKER_OPEN, "Trial request failed");
        return;
    }

    if (state == BREAKER_CLOSED && failures >= threshold) {
        opened_at = clock.now_ms();
        char reason[96];
        snprintf(reason, sizeof(reason), "%d consecutive failures", failures);
        transition_state(BREAKER_OPEN, reason);
    }
}

void CircuitBreaker::on_connectivity_restored()
{
    failures = std::max(0, failures - 1);
    LOG_DEBUG_CTX("breaker", "Connectivity restored, failures now %d", failures);
}

int64_t CircuitBreaker::ms_until_retry() const
{
    if (state != BREAKER_OPEN) {
        return 0;
    }
    int64_t remaining = opened_at + timeout_ms - clock.now_ms();
    return remaining > 0 ? remaining : 0;
}

void CircuitBreaker::reset()
{
    failures = 0;
    opened_at = 0;
    trial_in_flight = false;
    transition_state(BREAKER_CLOSED, "Reset");
}
