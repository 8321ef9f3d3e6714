#include "UploadCoordinator.h"
#include "EventBus.h"
#include "EventLoop.h"
#include "RetryScheduler.h"
#include "StateLogger.h"
#include "logger.h"

struct UploadCoordinator::Attempt {
    UploadRequest request;
    int max_attempts;
    int number;             // 0-based live attempt
    int64_t started_at;
    UploadProgressCallback progress;
    UploadDoneCallback done;
};

UploadCoordinator::UploadCoordinator(ResumableUploadClient& upload_client, RetryScheduler& retry,
                                     EventLoop& event_loop, EventBus* event_bus)
    : client(upload_client),
      scheduler(retry),
      loop(event_loop),
      bus(event_bus)
{
}

UploadCoordinator::~UploadCoordinator()
{
}

bool UploadCoordinator::is_in_flight(const std::string& submission_id) const
{
    return in_flight.count(submission_id) > 0;
}

void UploadCoordinator::log_upload_result(const Attempt& attempt, const UploadResult& result)
{
    int64_t duration_ms = loop.now_ms() - attempt.started_at;
    double completion_pct = (result.bytes_total > 0) ?
        (100.0 * (result.success ? result.bytes_total : result.bytes_sent) / result.bytes_total) : 0.0;
    if (completion_pct > 100.0) {
        completion_pct = 100.0;
    }

    int duration_sec = (int)(duration_ms / 1000);
    int duration_ms_part = (int)(duration_ms % 1000);
    std::string reason = result.success ? (result.url.empty() ? std::string("Accepted") : result.url)
                                        : result.error.to_string();

    // Single unified log line - easily greppable with "UPLOAD_RESULT:"
    LOG_STATE("UPLOAD_RESULT: %s | Submission: %s | Strategy: %s | Duration: %d.%03d s | "
              "Bytes: %lld (%.1f%%) | Chunks: %d | Chunk retries: %d | Fallbacks: %d | Attempts: %d/%d | Reason: %s",
              result.success ? "SUCCESS" : "FAILED",
              attempt.request.submission_id.c_str(),
              strategy_to_string(result.strategy),
              duration_sec, duration_ms_part,
              (long long)result.bytes_total, completion_pct,
              result.chunks, result.chunk_retries, result.fallbacks,
              attempt.number + 1, attempt.max_attempts,
              reason.c_str());
    LOG_INFO_CTX("upload_coord", "UPLOAD_RESULT: %s | Submission: %s | Strategy: %s | Duration: %d.%03d s | "
              "Bytes: %lld (%.1f%%) | Chunks: %d | Chunk retries: %d | Fallbacks: %d | Attempts: %d/%d | Reason: %s",
              result.success ? "SUCCESS" : "FAILED",
              attempt.request.submission_id.c_str(),
              strategy_to_string(result.strategy),
              duration_sec, duration_ms_part,
              (long long)result.bytes_total, completion_pct,
              result.chunks, result.chunk_retries, result.fallbacks,
              attempt.number + 1, attempt.max_attempts,
              reason.c_str());
}

void UploadCoordinator::publish_retries_paused(const Attempt& attempt)
{
    int64_t retry_in = scheduler.breaker().ms_until_retry();
    LOG_WARN_CTX("upload_coord", "Circuit open - retries paused for %lld ms", (long long)retry_in);

    if (!bus) {
        return;
    }
    PipelineEvent event(EVENT_RETRIES_PAUSED);
    event.instance_id = attempt.request.instance_id;
    event.submission_id = attempt.request.submission_id;
    event.retry_in_ms = retry_in;
    event.timestamp = loop.now_ms();
    event.message = describe_for_user(PipelineError(ERR_CIRCUIT_OPEN, ""), retry_in);
    bus->publish(event);
}

bool UploadCoordinator::start(const UploadRequest& request, int max_attempts,
                              UploadProgressCallback progress, UploadDoneCallback done,
                              PipelineError& error)
{
    if (is_in_flight(request.submission_id)) {
        error = PipelineError(ERR_REENTRANCY_GUARD,
                              "Upload of " + request.submission_id + " already in progress");
        LOG_WARN_CTX("upload_coord", "%s", error.message.c_str());
        return false;
    }

    std::shared_ptr<Attempt> attempt = std::make_shared<Attempt>();
    attempt->request = request;
    attempt->max_attempts = max_attempts > 0 ? max_attempts : 1;
    attempt->number = 0;
    attempt->started_at = loop.now_ms();
    attempt->progress = progress;
    attempt->done = done;

    if (!scheduler.breaker().allow_request()) {
        error = PipelineError(ERR_CIRCUIT_OPEN, "Circuit open, upload not attempted");
        publish_retries_paused(*attempt);
        return false;
    }

    in_flight.insert(request.submission_id);
    LOG_STATE("UPLOAD START: Submission %s | Bytes: %lld | Tier: %s | Link: %s",
              request.submission_id.c_str(), (long long)request.payload_size(),
              tier_to_string(request.tier), quality_to_string(request.quality));

    run_attempt(attempt, true);
    return true;
}

void UploadCoordinator::run_attempt(std::shared_ptr<Attempt> attempt, bool admitted)
{
    if (!admitted && !scheduler.breaker().allow_request()) {
        UploadResult result;
        result.error = PipelineError(ERR_CIRCUIT_OPEN, "Circuit opened between attempts");
        result.bytes_total = attempt->request.payload_size();
        finish(attempt, result);
        return;
    }

    client.upload(attempt->request, attempt->progress,
                  [this, attempt](const UploadResult& result) {
                      on_attempt_done(attempt, result);
                  });
}

void UploadCoordinator::on_attempt_done(std::shared_ptr<Attempt> attempt, const UploadResult& result)
{
    CircuitBreaker& breaker = scheduler.breaker();

    if (result.success) {
        breaker.record_success();
        finish(attempt, result);
        return;
    }

    if (result.error.counts_as_breaker_failure()) {
        breaker.record_failure();
    } else {
        // The server answered; a half-open trial is over either way
        breaker.record_success();
    }

    bool more_attempts = attempt->number + 1 < attempt->max_attempts;
    if (!result.error.is_retryable() || !more_attempts || breaker.get_state() == BREAKER_OPEN) {
        finish(attempt, result);
        return;
    }

    int64_t delay = scheduler.backoff_delay_ms(attempt->number);
    attempt->number++;
    LOG_INFO_CTX("upload_coord", "[%s] Attempt %d/%d failed (%s), retrying in %lld ms",
                 attempt->request.submission_id.c_str(), attempt->number, attempt->max_attempts,
                 result.error.to_string().c_str(), (long long)delay);

    loop.schedule_after(delay, [this, attempt]() {
        run_attempt(attempt, false);
    });
}

void UploadCoordinator::finish(std::shared_ptr<Attempt> attempt, const UploadResult& result)
{
    in_flight.erase(attempt->request.submission_id);
    log_upload_result(*attempt, result);

    if (!result.success && scheduler.breaker().get_state() == BREAKER_OPEN) {
        publish_retries_paused(*attempt);
    }

    if (attempt->done) {
        attempt->done(result);
    }
}
