#include "RetryScheduler.h"
#include "Clock.h"
#include "PipelineConstants.h"

#include <algorithm>
#include <cstdio>
#include <random>

namespace {

double default_random()
{
    static std::mt19937 generator(std::random_device{}());
    static std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(generator);
}

template <size_t N>
std::vector<int64_t> table(const int64_t (&values)[N])
{
    return std::vector<int64_t>(values, values + N);
}

} // namespace

RetryScheduler::RetryScheduler(const Clock& clk, const PipelineConfig& config,
                               std::function<double()> rng)
    : clock(clk),
      circuit(clk, config.breaker_threshold, config.breaker_timeout_ms),
      random(rng ? rng : std::function<double()>(default_random)),
      delay_override(config.retry_delays_ms),
      max_retries(config.max_retries),
      live_attempts(config.live_attempts > 0 ? config.live_attempts : 1),
      base_delay_ms(config.base_delay_ms),
      cap_multiplier(config.cap_multiplier),
      jitter_factor(config.jitter_factor)
{
}

RetryScheduler::~RetryScheduler()
{
}

int64_t RetryScheduler::compute_backoff_ms(int base_ms, int attempt, int cap, double jitter, double r)
{
    if (attempt < 0) {
        attempt = 0;
    }

    // 2^attempt saturates well before the shift could overflow
    int64_t multiplier = attempt >= 30 ? ((int64_t)1 << 30) : ((int64_t)1 << attempt);
    if (cap > 0) {
        multiplier = std::min(multiplier, (int64_t)cap);
    }
    double delay = (double)base_ms * (double)multiplier * (1.0 + jitter * r);
    return static_cast<int64_t>(delay);
}

int64_t RetryScheduler::backoff_delay_ms(int attempt) const
{
    return compute_backoff_ms(base_delay_ms, attempt, cap_multiplier, jitter_factor, random());
}

std::vector<int64_t> RetryScheduler::flush_delays(Tier tier, ConnectionQuality quality) const
{
    if (!delay_override.empty()) {
        return delay_override;
    }
    if (tier == TIER_C || quality == QUALITY_VERY_LOW) {
        return table(PipelineDefaults::FLUSH_DELAYS_SLOW_MS);
    }
    return table(PipelineDefaults::FLUSH_DELAYS_MS);
}

int64_t RetryScheduler::delay_for_retry(int retry_count, Tier tier, ConnectionQuality quality) const
{
    std::vector<int64_t> delays = flush_delays(tier, quality);
    if (delays.empty()) {
        return 0;
    }
    size_t index = retry_count < 0 ? 0 : std::min((size_t)retry_count, delays.size() - 1);
    return delays[index];
}

bool RetryScheduler::is_due_at(RecordStatus status, int retry_count, int64_t last_attempt_at,
                               Tier tier, ConnectionQuality quality) const
{
    if (status != RECORD_PENDING) {
        return false;
    }
    if (retry_count >= max_retries) {
        return false;
    }
    if (last_attempt_at <= 0) {
        return true;
    }
    return clock.now_ms() - last_attempt_at >= delay_for_retry(retry_count, tier, quality);
}

bool RetryScheduler::is_due(const SubmissionRecord& record, Tier tier, ConnectionQuality quality) const
{
    return is_due_at(record.status, record.retry_count, record.last_attempt_at, tier, quality);
}

bool RetryScheduler::is_due(const QueueEntrySummary& entry, Tier tier, ConnectionQuality quality) const
{
    return is_due_at(entry.status, entry.retry_count, entry.last_attempt_at, tier, quality);
}

RetryDecision RetryScheduler::classify(const PipelineError& error, std::string& reason) const
{
    char buffer[256];

    if (error.kind == ERR_CIRCUIT_OPEN) {
        snprintf(buffer, sizeof(buffer), "Circuit open, next trial in %lld ms",
                 (long long)circuit.ms_until_retry());
        reason = buffer;
        return DECISION_PAUSE;
    }

    // No endpoint to send to yet; the record waits for a configuration change
    if (error.kind == ERR_CONFIGURATION) {
        reason = "No upload endpoint configured - records stay pending";
        return DECISION_PAUSE;
    }

    if (error.is_retryable()) {
        snprintf(buffer, sizeof(buffer), "%s is transient - rescheduling",
                 error_kind_to_string(error.kind));
        reason = buffer;
        return DECISION_RETRY;
    }

    // Quota, 4xx, malformed, validation: retrying cannot help
    snprintf(buffer, sizeof(buffer), "%s is not retryable - left for manual review",
             error_kind_to_string(error.kind));
    reason = buffer;
    return DECISION_HALT;
}
