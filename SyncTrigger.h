#ifndef SYNC_TRIGGER_H
#define SYNC_TRIGGER_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "PipelineConfig.h"
#include "PipelineError.h"
#include "SubmissionRecord.h"

class ConnectivityMonitor;
class EventLoop;
class PersistentQueue;
class RetryScheduler;
class TierClassifier;
class UploadCoordinator;
struct UploadRequest;
struct UploadResult;

// Outcome of one flush pass
struct FlushSummary {
    int examined;
    int uploaded;
    int rescheduled;
    int halted;
    int skipped;
    bool paused;                // stopped by the circuit breaker
    std::string stop_reason;

    FlushSummary()
        : examined(0), uploaded(0), rescheduled(0), halted(0), skipped(0), paused(false) {}
};

/**
 * Drains the PersistentQueue.
 *
 * Triggers: a startup delay, a periodic timer, connectivity coming back
 * and explicit flush_now() calls. Only one pass runs at a time and only
 * while online.
 *
 * A pass walks the queue in creation order and uploads due records one at
 * a time. Exhausted, halted, in-flight and not-yet-due records are skipped.
 * The pass stops at the first non-retryable error (that record is marked
 * failed) or when the breaker opens; everything after it stays pending.
 */
class SyncTrigger
{
public:
    typedef std::function<void(const FlushSummary&)> PassListener;

    SyncTrigger(PersistentQueue& queue, UploadCoordinator& coordinator, RetryScheduler& scheduler,
                TierClassifier& classifier, ConnectivityMonitor& connectivity, EventLoop& loop,
                const PipelineConfig& config);
    ~SyncTrigger();

    void start();
    void stop();

    // Returns false when skipped (pass already running, or offline)
    bool flush_now(const std::string& reason);

    // User-initiated retry of one record. Ignores the delay table and the
    // retry cap; still subject to the breaker.
    bool retry_record(const std::string& id, PipelineError& error);

    bool is_flushing() const { return flushing; }
    bool is_running() const { return running; }
    int get_pass_count() const { return pass_count; }
    const FlushSummary& get_last_summary() const { return last_summary; }

    void set_pass_listener(PassListener listener) { pass_listener = listener; }

private:
    void schedule_periodic();
    void on_connectivity_restored();

    void process_next();
    void on_record_done(const SubmissionRecord& record, const UploadResult& result);
    void finish_pass(const std::string& reason);

    UploadRequest build_request(const SubmissionRecord& record) const;

    // Puts an 'uploading' record back to 'pending' without counting an attempt
    void release(const std::string& id);

    PersistentQueue& queue;
    UploadCoordinator& coordinator;
    RetryScheduler& scheduler;
    TierClassifier& classifier;
    ConnectivityMonitor& connectivity;
    EventLoop& loop;
    PipelineConfig config;

    bool running;
    bool flushing;
    bool listener_registered;
    uint64_t startup_timer;
    uint64_t periodic_timer;
    int pass_count;

    std::vector<QueueEntrySummary> pass_entries;
    size_t pass_index;
    FlushSummary summary;
    FlushSummary last_summary;
    PassListener pass_listener;

    SyncTrigger(const SyncTrigger&) = delete;
    SyncTrigger& operator=(const SyncTrigger&) = delete;
};

#endif // SYNC_TRIGGER_H
