#ifndef RETRY_SCHEDULER_H
#define RETRY_SCHEDULER_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "CircuitBreaker.h"
#include "PipelineConfig.h"
#include "PipelineError.h"
#include "SubmissionRecord.h"
#include "SubmissionTypes.h"

class Clock;

// Retry policy for live attempts and queue flushes. Owns the circuit breaker
// that every upload path consults.
class RetryScheduler
{
public:
    // random() must return values in [0, 1); tests pass a constant
    RetryScheduler(const Clock& clock, const PipelineConfig& config,
                   std::function<double()> random = std::function<double()>());
    ~RetryScheduler();

    // base * min(2^attempt, cap) * (1 + jitter * r)
    static int64_t compute_backoff_ms(int base_ms, int attempt, int cap_multiplier,
                                      double jitter_factor, double r);

    // Wait before live attempt number `attempt` (0-based) is repeated
    int64_t backoff_delay_ms(int attempt) const;

    // Flush delay table for this device, retry-count indexed, last entry repeats
    std::vector<int64_t> flush_delays(Tier tier, ConnectionQuality quality) const;
    int64_t delay_for_retry(int retry_count, Tier tier, ConnectionQuality quality) const;

    // Pending, below the retry cap, and its delay since the last attempt has passed
    bool is_due(const SubmissionRecord& record, Tier tier, ConnectionQuality quality) const;
    bool is_due(const QueueEntrySummary& entry, Tier tier, ConnectionQuality quality) const;

    // What a flush does with a record after this error
    RetryDecision classify(const PipelineError& error, std::string& reason) const;

    CircuitBreaker& breaker() { return circuit; }
    const CircuitBreaker& breaker() const { return circuit; }

    int get_max_retries() const { return max_retries; }
    int get_live_attempts() const { return live_attempts; }

private:
    bool is_due_at(RecordStatus status, int retry_count, int64_t last_attempt_at,
                   Tier tier, ConnectionQuality quality) const;

    const Clock& clock;
    CircuitBreaker circuit;
    std::function<double()> random;
    std::vector<int64_t> delay_override;
    int max_retries;
    int live_attempts;
    int base_delay_ms;
    int cap_multiplier;
    double jitter_factor;
};

#endif // RETRY_SCHEDULER_H
