#include "SubmissionStateMachine.h"
#include "ConnectivityMonitor.h"
#include "EventLoop.h"
#include "PersistentQueue.h"
#include "RetryScheduler.h"
#include "StateLogger.h"
#include "TierClassifier.h"
#include "UploadCoordinator.h"
#include "Utility.h"
#include "logger.h"

namespace {

// Live failures that will fail the same way on every retry
bool needs_manual_review(const PipelineError& error)
{
    return error.kind == ERR_SERVER_4XX || error.kind == ERR_MALFORMED_RESPONSE;
}

} // namespace

SubmissionStateMachine::SubmissionStateMachine(const std::string& instance_id,
                                               const PipelineServices& pipeline)
    : services(pipeline),
      generation(0)
{
    state.instance_id = instance_id;
}

SubmissionStateMachine::~SubmissionStateMachine()
{
}

void SubmissionStateMachine::transition_state(SubmissionStatus new_state, const std::string& reason)
{
    if (new_state != state.status) {
        LOG_INFO_CTX("submission", "[%s] STATE TRANSITION: %s -> %s | Reason: %s",
                     state.instance_id.c_str(),
                     status_to_string(state.status),
                     status_to_string(new_state),
                     reason.c_str());

        LOG_STATE("SUBMISSION STATE: %s | %s -> %s | %s",
                  state.instance_id.c_str(),
                  status_to_string(state.status),
                  status_to_string(new_state),
                  reason.c_str());

        state.status = new_state;
    }
}

bool SubmissionStateMachine::require(std::initializer_list<SubmissionStatus> allowed,
                                     const char* command, PipelineError& error) const
{
    for (SubmissionStatus s : allowed) {
        if (state.status == s) {
            return true;
        }
    }

    error = PipelineError(ERR_VALIDATION, std::string(command) + " is not allowed in state " +
                          status_to_string(state.status));
    LOG_WARN_CTX("submission", "[%s] Rejected: %s", state.instance_id.c_str(), error.message.c_str());
    return false;
}

void SubmissionStateMachine::publish(PipelineEventType type, const std::string& message)
{
    if (!services.bus) {
        return;
    }
    PipelineEvent event(type);
    event.instance_id = state.instance_id;
    event.submission_id = state.submission.submission_id;
    event.progress = state.submission.progress;
    event.message = message;
    event.timestamp = services.loop ? services.loop->now_ms() : 0;
    services.bus->publish(event);
}

bool SubmissionStateMachine::initialize(PipelineError& error)
{
    if (!require({SUB_UNINITIALIZED}, "initialize", error)) {
        return false;
    }
    if (!services.is_complete()) {
        error = PipelineError(ERR_CONFIGURATION, "Pipeline services are not wired");
        LOG_ERROR_CTX("submission", "[%s] %s", state.instance_id.c_str(), error.message.c_str());
        return false;
    }

    if (!services.classifier->has_result()) {
        services.classifier->detect();
    }
    state.environment = services.classifier->environment_snapshot();
    state.tier = services.classifier->get_tier();
    state.quality = services.classifier->get_quality();

    transition_state(SUB_IDLE, std::string("Initialized, tier ") + tier_to_string(state.tier));
    return true;
}

bool SubmissionStateMachine::start_calibration(PipelineError& error)
{
    if (!require({SUB_IDLE}, "start_calibration", error)) {
        return false;
    }
    state.calibration = CalibrationSnapshot();
    transition_state(SUB_CALIBRATING, "Calibration started");
    return true;
}

bool SubmissionStateMachine::complete_calibration(const CalibrationSnapshot& snapshot, PipelineError& error)
{
    if (!require({SUB_CALIBRATING}, "complete_calibration", error)) {
        return false;
    }
    state.calibration = snapshot;
    state.calibration.complete = true;
    transition_state(SUB_IDLE, "Calibration complete");
    return true;
}

bool SubmissionStateMachine::start_recording(PipelineError& error)
{
    if (!require({SUB_IDLE, SUB_CALIBRATING}, "start_recording", error)) {
        return false;
    }
    transition_state(SUB_RECORDING, "Recording started");
    return true;
}

bool SubmissionStateMachine::stop_recording(PipelineError& error)
{
    if (!require({SUB_RECORDING}, "stop_recording", error)) {
        return false;
    }
    transition_state(SUB_PROCESSING, "Recording stopped, encoding");
    return true;
}

bool SubmissionStateMachine::accept_payload(const char* kind, const std::string& file_name,
                                            const std::string& mime_type,
                                            std::shared_ptr<const std::vector<uint8_t>> data,
                                            PipelineError& error)
{
    if (!data || data->empty()) {
        error = PipelineError(ERR_VALIDATION, "Empty payload");
        return false;
    }
    if (services.queue && (int64_t)data->size() > services.queue->get_max_blob_size()) {
        error = PipelineError(ERR_PAYLOAD_TOO_LARGE, "Payload of " + std::to_string(data->size()) +
                              " bytes exceeds the upload limit");
        LOG_WARN_CTX("submission", "[%s] %s", state.instance_id.c_str(), error.message.c_str());
        return false;
    }

    state.source.kind = kind;
    state.source.file_name = file_name.empty() ? std::string("recording.webm") : file_name;
    state.source.mime_type = mime_type.empty() ? guess_mime_type(state.source.file_name) : mime_type;
    state.source.data = data;

    int seconds = TierClassifier::estimate_upload_seconds(state.source.size(),
                                                          state.environment.value("downlink", 0.0),
                                                          state.environment.value("effectiveType", std::string()));
    transition_state(SUB_READY_TO_SUBMIT, std::string(kind) + " " + state.source.file_name +
                     " ready, upload " + TierClassifier::format_upload_estimate(seconds));
    return true;
}

bool SubmissionStateMachine::recording_available(const std::string& file_name, const std::string& mime_type,
                                                 std::shared_ptr<const std::vector<uint8_t>> data,
                                                 PipelineError& error)
{
    if (!require({SUB_PROCESSING}, "recording_available", error)) {
        return false;
    }
    return accept_payload("recording", file_name, mime_type, data, error);
}

bool SubmissionStateMachine::attach_file(const std::string& file_name, const std::string& mime_type,
                                         std::shared_ptr<const std::vector<uint8_t>> data,
                                         PipelineError& error)
{
    if (!require({SUB_IDLE, SUB_READY_TO_SUBMIT}, "attach_file", error)) {
        return false;
    }
    return accept_payload("file", file_name, mime_type, data, error);
}

bool SubmissionStateMachine::update_transcript(const std::string& transcript, PipelineError& error)
{
    if (state.status == SUB_UNINITIALIZED || state.status == SUB_SUBMITTING) {
        return require({}, "update_transcript", error);
    }
    state.transcript = transcript;
    return true;
}

SubmissionRecord SubmissionStateMachine::build_record(const std::string& submission_id) const
{
    SubmissionRecord record;
    record.id = submission_id;
    record.instance_id = state.instance_id;
    record.file_name = state.source.file_name;
    record.mime_type = state.source.mime_type;
    record.payload = *state.source.data;
    record.form_fields = state.form_fields;
    record.metadata.calibration = state.calibration;
    record.metadata.environment = state.environment;
    record.metadata.transcript = state.transcript;
    record.metadata.tier = state.tier;
    return record;
}

UploadRequest SubmissionStateMachine::build_request(const SubmissionRecord& record) const
{
    UploadRequest request;
    request.submission_id = record.id;
    request.instance_id = record.instance_id;
    request.file_name = record.file_name;
    request.mime_type = record.mime_type;
    request.payload = state.source.data;
    request.form_fields = record.form_fields;
    request.metadata = record.metadata.to_json();
    request.tier = state.tier;
    request.quality = services.classifier ? services.classifier->get_quality() : state.quality;
    return request;
}

bool SubmissionStateMachine::submit(const FieldList& form_fields, PipelineError& error)
{
    if (!require({SUB_READY_TO_SUBMIT}, "submit", error)) {
        return false;
    }
    if (!state.source.data) {
        error = PipelineError(ERR_VALIDATION, "Nothing to submit");
        return false;
    }

    state.form_fields = form_fields;
    state.error = PipelineError();
    state.submission = SubmissionProgress();
    state.submission.submission_id = generate_submission_id(services.loop->now_ms());
    state.submission.strategy = services.coordinator->get_client().select_strategy(
        state.source.size(), state.tier);

    SubmissionRecord record = build_record(state.submission.submission_id);

    transition_state(SUB_SUBMITTING, "Submitting " + record.id);
    publish(EVENT_SUBMISSION_STARTED, "Uploading");

    if (!services.connectivity->is_online()) {
        LOG_INFO_CTX("submission", "[%s] Offline, saving %s without a network attempt",
                     state.instance_id.c_str(), record.id.c_str());
        enqueue(record, PipelineError(ERR_NETWORK, "Offline"), false);
        return true;
    }

    uint64_t current = generation;
    std::weak_ptr<SubmissionStateMachine> weak = shared_from_this();
    PersistentQueue* queue = services.queue;

    UploadProgressCallback progress = [weak, current](int64_t uploaded, int64_t total) {
        std::shared_ptr<SubmissionStateMachine> self = weak.lock();
        if (self) {
            self->on_upload_progress(current, uploaded, total);
        }
    };
    UploadDoneCallback done = [weak, current, record, queue](const UploadResult& result) {
        std::shared_ptr<SubmissionStateMachine> self = weak.lock();
        if (self) {
            self->on_upload_done(current, record, result);
        } else {
            preserve_abandoned(queue, record, result);
        }
    };

    PipelineError start_error;
    if (!services.coordinator->start(build_request(record), services.config.live_attempts,
                                     progress, done, start_error)) {
        // Breaker open (or a duplicate attempt): keep the artifact for the flush
        enqueue(record, start_error, false);
    }
    return true;
}

void SubmissionStateMachine::on_upload_progress(uint64_t current, int64_t uploaded, int64_t total)
{
    if (current != generation || state.status != SUB_SUBMITTING || total <= 0) {
        return;
    }
    state.submission.progress = (double)uploaded / (double)total;
    publish(EVENT_UPLOAD_PROGRESS, "Uploading");
}

void SubmissionStateMachine::on_upload_done(uint64_t current, const SubmissionRecord& record,
                                            const UploadResult& result)
{
    if (current != generation || state.status != SUB_SUBMITTING) {
        preserve_abandoned(services.queue, record, result);
        return;
    }

    if (result.success) {
        state.submission.progress = 1.0;
        state.submission.final_url = result.url;
        state.submission.strategy = result.strategy;
        state.message = describe_for_user(PipelineError());
        transition_state(SUB_COMPLETE, "Uploaded via " + std::string(strategy_to_string(result.strategy)));
        publish(EVENT_SUBMISSION_COMPLETE, state.message);
        return;
    }

    enqueue(record, result.error, true);
}

void SubmissionStateMachine::enqueue(const SubmissionRecord& record, const PipelineError& cause,
                                     bool attempted)
{
    SubmissionRecord draft = record;
    draft.last_error = cause.to_string();
    if (attempted) {
        draft.last_attempt_at = services.loop->now_ms();
    }

    std::string id;
    PipelineError queue_error;
    if (!services.queue->add(draft, id, queue_error)) {
        // Neither uploaded nor stored: the user has to know
        state.error = queue_error;
        state.message = describe_for_user(queue_error);
        LOG_ERROR_CTX("submission", "[%s] Upload failed (%s) and the queue rejected %s: %s",
                      state.instance_id.c_str(), cause.to_string().c_str(), record.id.c_str(),
                      queue_error.to_string().c_str());
        transition_state(SUB_ERROR, "Enqueue failed: " + queue_error.to_string());
        publish(EVENT_SUBMISSION_FAILED, state.message);
        return;
    }

    if (needs_manual_review(cause)) {
        PipelineError mark_error;
        if (!services.queue->mark_status(id, RECORD_FAILED, cause.to_string(), mark_error)) {
            LOG_WARN_CTX("submission", "[%s] Could not flag %s for review: %s",
                         state.instance_id.c_str(), id.c_str(), mark_error.to_string().c_str());
        }
    }

    state.error = cause;
    state.submission.is_queued = true;
    if (cause.kind == ERR_CIRCUIT_OPEN) {
        state.message = describe_for_user(cause, services.coordinator->get_scheduler().breaker().ms_until_retry());
    } else if (needs_manual_review(cause)) {
        state.message = describe_for_user(cause);
    } else {
        state.message = describe_for_user(PipelineError(ERR_NETWORK, ""));
    }

    transition_state(SUB_QUEUED, "Saved offline: " + cause.to_string());
    publish(EVENT_SUBMISSION_QUEUED, state.message);
}

void SubmissionStateMachine::preserve_abandoned(PersistentQueue* queue, const SubmissionRecord& record,
                                                const UploadResult& result)
{
    if (result.success) {
        LOG_INFO_CTX("submission", "Abandoned submission %s finished uploading", record.id.c_str());
        return;
    }
    if (!queue) {
        LOG_ERROR_CTX("submission", "Abandoned submission %s failed and no queue is available",
                      record.id.c_str());
        return;
    }

    SubmissionRecord draft = record;
    draft.last_error = result.error.to_string();

    std::string id;
    PipelineError error;
    if (queue->add(draft, id, error)) {
        LOG_INFO_CTX("submission", "Abandoned submission %s saved to the queue", id.c_str());
    } else {
        LOG_ERROR_CTX("submission", "Abandoned submission %s lost: %s", record.id.c_str(),
                      error.to_string().c_str());
        LOG_STATE("SUBMISSION LOST: %s | %s", record.id.c_str(), error.to_string().c_str());
    }
}

void SubmissionStateMachine::fail(const PipelineError& cause)
{
    state.error = cause;
    state.message = describe_for_user(cause);
    transition_state(SUB_ERROR, cause.to_string());
    publish(EVENT_SUBMISSION_FAILED, state.message);
}

bool SubmissionStateMachine::reset(PipelineError& error)
{
    if (state.status == SUB_UNINITIALIZED) {
        return require({}, "reset", error);
    }
    if (state.status == SUB_SUBMITTING) {
        LOG_WARN_CTX("submission", "[%s] Reset while submitting %s, a late failure is still queued",
                     state.instance_id.c_str(), state.submission.submission_id.c_str());
    }

    generation++;

    ApplicationState fresh;
    fresh.instance_id = state.instance_id;
    fresh.environment = state.environment;
    fresh.tier = state.tier;
    fresh.quality = state.quality;
    fresh.status = state.status;
    state = fresh;

    transition_state(SUB_IDLE, "Reset");
    return true;
}
