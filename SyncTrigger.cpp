#include "SyncTrigger.h"
#include "ConnectivityMonitor.h"
#include "EventLoop.h"
#include "PersistentQueue.h"
#include "ResumableUploadClient.h"
#include "RetryScheduler.h"
#include "StateLogger.h"
#include "TierClassifier.h"
#include "UploadCoordinator.h"
#include "logger.h"

SyncTrigger::SyncTrigger(PersistentQueue& record_queue, UploadCoordinator& upload_coordinator,
                         RetryScheduler& retry, TierClassifier& tier_classifier,
                         ConnectivityMonitor& monitor, EventLoop& event_loop,
                         const PipelineConfig& cfg)
    : queue(record_queue),
      coordinator(upload_coordinator),
      scheduler(retry),
      classifier(tier_classifier),
      connectivity(monitor),
      loop(event_loop),
      config(cfg),
      running(false),
      flushing(false),
      listener_registered(false),
      startup_timer(0),
      periodic_timer(0),
      pass_count(0),
      pass_index(0)
{
}

SyncTrigger::~SyncTrigger()
{
    stop();
}

void SyncTrigger::start()
{
    if (running) {
        return;
    }
    running = true;

    if (!listener_registered) {
        connectivity.on_restored([this]() { on_connectivity_restored(); });
        listener_registered = true;
    }

    startup_timer = loop.schedule_after(config.sync_startup_delay_ms, [this]() {
        startup_timer = 0;
        flush_now("startup");
    });
    schedule_periodic();

    LOG_INFO_CTX("sync", "Sync trigger started (startup delay %d ms, period %d s)",
                 config.sync_startup_delay_ms, config.sync_period_seconds);
}

void SyncTrigger::stop()
{
    if (!running) {
        return;
    }
    running = false;

    if (startup_timer) {
        loop.cancel(startup_timer);
        startup_timer = 0;
    }
    if (periodic_timer) {
        loop.cancel(periodic_timer);
        periodic_timer = 0;
    }
    LOG_INFO_CTX("sync", "Sync trigger stopped");
}

void SyncTrigger::schedule_periodic()
{
    if (!running || config.sync_period_seconds <= 0) {
        return;
    }
    periodic_timer = loop.schedule_after((int64_t)config.sync_period_seconds * 1000, [this]() {
        periodic_timer = 0;
        flush_now("periodic");
        schedule_periodic();
    });
}

void SyncTrigger::on_connectivity_restored()
{
    if (!running) {
        return;
    }
    scheduler.breaker().on_connectivity_restored();
    flush_now("connectivity restored");
}

bool SyncTrigger::flush_now(const std::string& reason)
{
    if (flushing) {
        LOG_DEBUG_CTX("sync", "Flush (%s) skipped: a pass is already running", reason.c_str());
        return false;
    }
    if (!connectivity.is_online()) {
        LOG_DEBUG_CTX("sync", "Flush (%s) skipped: offline", reason.c_str());
        return false;
    }

    int64_t max_age_ms = (int64_t)config.max_age_hours * 3600 * 1000;
    int purged = queue.purge_expired(max_age_ms);
    if (purged > 0) {
        LOG_INFO_CTX("sync", "Purged %d expired records", purged);
    }

    PipelineError error;
    pass_entries.clear();
    if (!queue.list(pass_entries, error)) {
        LOG_ERROR_CTX("sync", "Cannot read the queue: %s", error.to_string().c_str());
        return false;
    }

    flushing = true;
    pass_count++;
    pass_index = 0;
    summary = FlushSummary();

    LOG_INFO_CTX("sync", "Flush pass %d (%s): %zu queued records", pass_count, reason.c_str(),
                 pass_entries.size());
    LOG_STATE("FLUSH START: pass %d | %s | %zu records", pass_count, reason.c_str(),
              pass_entries.size());

    process_next();
    return true;
}

UploadRequest SyncTrigger::build_request(const SubmissionRecord& record) const
{
    UploadRequest request;
    request.submission_id = record.id;
    request.instance_id = record.instance_id;
    request.file_name = record.file_name;
    request.mime_type = record.mime_type;
    request.payload = std::make_shared<const std::vector<uint8_t>>(record.payload);
    request.form_fields = record.form_fields;
    request.metadata = record.metadata.to_json();
    request.tier = classifier.get_tier();
    request.quality = classifier.get_quality();
    return request;
}

void SyncTrigger::release(const std::string& id)
{
    PipelineError error;
    if (!queue.mark_status(id, RECORD_PENDING, "", error)) {
        LOG_WARN_CTX("sync", "Cannot return %s to pending: %s", id.c_str(), error.to_string().c_str());
    }
}

void SyncTrigger::process_next()
{
    Tier tier = classifier.get_tier();
    ConnectionQuality quality = classifier.get_quality();

    while (pass_index < pass_entries.size()) {
        const QueueEntrySummary entry = pass_entries[pass_index++];
        summary.examined++;

        if (entry.status == RECORD_FAILED ||
            entry.retry_count >= scheduler.get_max_retries() ||
            coordinator.is_in_flight(entry.id) ||
            !scheduler.is_due(entry, tier, quality)) {
            summary.skipped++;
            continue;
        }

        SubmissionRecord record;
        PipelineError error;
        if (!queue.get(entry.id, record, error)) {
            // Removed since the pass started
            LOG_DEBUG_CTX("sync", "Skipping %s: %s", entry.id.c_str(), error.to_string().c_str());
            summary.skipped++;
            continue;
        }

        if (!queue.mark_status(record.id, RECORD_UPLOADING, "", error)) {
            LOG_ERROR_CTX("sync", "Cannot mark %s uploading: %s", record.id.c_str(),
                          error.to_string().c_str());
            finish_pass("storage error");
            return;
        }

        PipelineError start_error;
        bool started = coordinator.start(build_request(record), 1, UploadProgressCallback(),
                                         [this, record](const UploadResult& result) {
                                             on_record_done(record, result);
                                         },
                                         start_error);
        if (started) {
            return;  // resumes in on_record_done()
        }

        release(record.id);
        if (start_error.kind == ERR_CIRCUIT_OPEN) {
            summary.paused = true;
            finish_pass("circuit open");
            return;
        }
        summary.skipped++;
    }

    finish_pass("queue walked");
}

void SyncTrigger::on_record_done(const SubmissionRecord& record, const UploadResult& result)
{
    PipelineError error;

    if (result.success) {
        if (!queue.remove(record.id, error)) {
            LOG_ERROR_CTX("sync", "Uploaded %s but could not remove it: %s", record.id.c_str(),
                          error.to_string().c_str());
        }
        summary.uploaded++;
        LOG_STATE("FLUSH UPLOADED: %s", record.id.c_str());
        process_next();
        return;
    }

    std::string reason;
    RetryDecision decision = scheduler.classify(result.error, reason);
    LOG_INFO_CTX("sync", "%s: %s -> %s (%s)", record.id.c_str(), result.error.to_string().c_str(),
                 decision_to_string(decision), reason.c_str());

    switch (decision) {
        case DECISION_RETRY:
            if (!queue.update_retry(record.id, record.retry_count + 1, result.error.to_string(), error)) {
                LOG_ERROR_CTX("sync", "Cannot reschedule %s: %s", record.id.c_str(),
                              error.to_string().c_str());
            }
            summary.rescheduled++;
            process_next();
            break;

        case DECISION_HALT:
            if (!queue.mark_status(record.id, RECORD_FAILED, result.error.to_string(), error)) {
                LOG_ERROR_CTX("sync", "Cannot halt %s: %s", record.id.c_str(), error.to_string().c_str());
            }
            summary.halted++;
            finish_pass("non-retryable error on " + record.id);
            break;

        case DECISION_PAUSE:
        default:
            // Every later record would stop the same way
            release(record.id);
            summary.paused = true;
            finish_pass(result.error.kind == ERR_CIRCUIT_OPEN ? std::string("circuit open") : reason);
            break;
    }
}

void SyncTrigger::finish_pass(const std::string& reason)
{
    summary.stop_reason = reason;
    flushing = false;
    pass_entries.clear();
    last_summary = summary;

    LOG_INFO_CTX("sync", "Flush pass %d done (%s): uploaded=%d rescheduled=%d halted=%d skipped=%d",
                 pass_count, reason.c_str(), summary.uploaded, summary.rescheduled,
                 summary.halted, summary.skipped);
    LOG_STATE("FLUSH END: pass %d | %s | uploaded=%d rescheduled=%d halted=%d skipped=%d",
              pass_count, reason.c_str(), summary.uploaded, summary.rescheduled,
              summary.halted, summary.skipped);

    if (pass_listener) {
        pass_listener(last_summary);
    }
}

bool SyncTrigger::retry_record(const std::string& id, PipelineError& error)
{
    if (coordinator.is_in_flight(id)) {
        error = PipelineError(ERR_REENTRANCY_GUARD, "Upload of " + id + " already in progress");
        return false;
    }

    SubmissionRecord record;
    if (!queue.get(id, record, error)) {
        return false;
    }
    if (!queue.mark_status(id, RECORD_UPLOADING, "", error)) {
        return false;
    }

    LOG_INFO_CTX("sync", "Manual retry of %s (retry count %d)", id.c_str(), record.retry_count);

    bool started = coordinator.start(build_request(record), 1, UploadProgressCallback(),
        [this, record](const UploadResult& result) {
            PipelineError update_error;
            bool ok;
            if (result.success) {
                ok = queue.remove(record.id, update_error);
            } else if (result.error.is_retryable()) {
                ok = queue.update_retry(record.id, record.retry_count + 1,
                                        result.error.to_string(), update_error);
            } else if (result.error.kind == ERR_CIRCUIT_OPEN) {
                ok = queue.mark_status(record.id, RECORD_PENDING, "", update_error);
            } else if (result.error.kind == ERR_CONFIGURATION) {
                ok = queue.mark_status(record.id, RECORD_PENDING, result.error.to_string(), update_error);
            } else {
                ok = queue.mark_status(record.id, RECORD_FAILED, result.error.to_string(), update_error);
            }
            if (!ok) {
                LOG_ERROR_CTX("sync", "Manual retry of %s: cannot record outcome: %s",
                              record.id.c_str(), update_error.to_string().c_str());
            }
        },
        error);

    if (!started) {
        release(id);
    }
    return started;
}
