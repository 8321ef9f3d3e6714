#ifndef UPLOAD_COORDINATOR_H
#define UPLOAD_COORDINATOR_H

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include "PipelineError.h"
#include "ResumableUploadClient.h"

class EventBus;
class EventLoop;
class RetryScheduler;

// Runs upload attempts for the state machine and the queue flush.
//
// - At most one attempt per submission id is in flight.
// - Every attempt passes the circuit breaker first; outcomes feed it back.
// - Retryable failures are repeated live with exponential backoff, up to
//   max_attempts, before the caller sees the failure.
class UploadCoordinator
{
public:
    UploadCoordinator(ResumableUploadClient& client, RetryScheduler& scheduler,
                      EventLoop& loop, EventBus* bus = nullptr);
    ~UploadCoordinator();

    // Returns false without any I/O when the submission is already in flight
    // (ERR_REENTRANCY_GUARD) or the breaker rejects it (ERR_CIRCUIT_OPEN);
    // `done` is not called in that case. Otherwise `done` runs exactly once.
    bool start(const UploadRequest& request, int max_attempts,
               UploadProgressCallback progress, UploadDoneCallback done,
               PipelineError& error);

    bool is_in_flight(const std::string& submission_id) const;
    size_t in_flight_count() const { return in_flight.size(); }

    ResumableUploadClient& get_client() { return client; }
    RetryScheduler& get_scheduler() { return scheduler; }

private:
    struct Attempt;

    void run_attempt(std::shared_ptr<Attempt> attempt, bool admitted);
    void on_attempt_done(std::shared_ptr<Attempt> attempt, const UploadResult& result);
    void finish(std::shared_ptr<Attempt> attempt, const UploadResult& result);

    // Unified upload result logging - single source of truth for all upload outcomes
    void log_upload_result(const Attempt& attempt, const UploadResult& result);

    void publish_retries_paused(const Attempt& attempt);

    ResumableUploadClient& client;
    RetryScheduler& scheduler;
    EventLoop& loop;
    EventBus* bus;
    std::set<std::string> in_flight;

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;
};

#endif // UPLOAD_COORDINATOR_H
