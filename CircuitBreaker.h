#ifndef CIRCUIT_BREAKER_H
#define CIRCUIT_BREAKER_H

#include <cstdint>
#include <string>
#include "SubmissionTypes.h"

class Clock;

// Three-state breaker shared by every upload attempt.
//
//   CLOSED --(failures >= threshold)--> OPEN --(timeout)--> HALF_OPEN
//   HALF_OPEN --(success)--> CLOSED,  HALF_OPEN --(failure)--> OPEN
//
// HALF_OPEN admits exactly one trial request until its outcome is recorded.
class CircuitBreaker
{
public:
    CircuitBreaker(const Clock& clock, int threshold, int64_t timeout_ms);
    ~CircuitBreaker();

    // False while open (or while the half-open trial is outstanding)
    bool allow_request();

    void record_success();
    void record_failure();

    // Link came back: forgive one failure
    void on_connectivity_restored();

    BreakerState get_state() const { return state; }
    int get_failures() const { return failures; }
    int get_threshold() const { return threshold; }
    int64_t get_timeout_ms() const { return timeout_ms; }
    int64_t get_opened_at() const { return opened_at; }

    // Time left before the next trial is allowed, 0 when not open
    int64_t ms_until_retry() const;

    void reset();

private:
    void transition_state(BreakerState new_state, const std::string& reason);

    const Clock& clock;
    int threshold;
    int64_t timeout_ms;
    BreakerState state;
    int failures;
    int64_t opened_at;
    bool trial_in_flight;
};

#endif // CIRCUIT_BREAKER_H
