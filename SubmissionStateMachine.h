#ifndef SUBMISSION_STATE_MACHINE_H
#define SUBMISSION_STATE_MACHINE_H

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "EventBus.h"
#include "PipelineError.h"
#include "PipelineServices.h"
#include "ResumableUploadClient.h"
#include "SubmissionRecord.h"
#include "SubmissionTypes.h"

// The artifact waiting to be submitted
struct PayloadSource {
    std::string kind;               // "recording" or "file"
    std::string file_name;
    std::string mime_type;
    std::shared_ptr<const std::vector<uint8_t>> data;

    int64_t size() const { return data ? (int64_t)data->size() : 0; }
};

struct SubmissionProgress {
    std::string submission_id;
    double progress;                // 0..1
    UploadStrategy strategy;
    bool is_queued;
    std::string final_url;

    SubmissionProgress() : progress(0.0), strategy(STRATEGY_NONE), is_queued(false) {}
};

// Per-instance application state. Not persisted; reset() keeps
// instance_id, environment and tier.
struct ApplicationState {
    std::string instance_id;
    nlohmann::json environment;
    Tier tier;
    ConnectionQuality quality;
    SubmissionStatus status;
    PipelineError error;
    std::string message;            // user-facing text for the current status
    PayloadSource source;
    SubmissionProgress submission;
    CalibrationSnapshot calibration;
    std::string transcript;
    FieldList form_fields;

    ApplicationState()
        : environment(nlohmann::json::object()), tier(TIER_A), quality(QUALITY_HIGH),
          status(SUB_UNINITIALIZED) {}
};

/**
 * Lifecycle of one recording instance:
 *
 *   UNINITIALIZED -> IDLE -> {CALIBRATING, RECORDING} -> PROCESSING
 *     -> READY_TO_SUBMIT -> SUBMITTING -> {COMPLETE, QUEUED}
 *
 * ERROR is reachable from every state and reset() returns to IDLE.
 * Commands issued from a state that does not allow them are rejected with
 * ERR_VALIDATION and change nothing.
 *
 * submit() resolves every outcome into success (COMPLETE), a durable
 * queue entry (QUEUED) or a user-visible ERROR. A captured artifact is
 * never dropped: a failed upload is written to the PersistentQueue even
 * when the failure is not retryable.
 *
 * Instances must be owned by a std::shared_ptr (upload callbacks hold a
 * weak reference).
 */
class SubmissionStateMachine : public std::enable_shared_from_this<SubmissionStateMachine>
{
public:
    SubmissionStateMachine(const std::string& instance_id, const PipelineServices& services);
    ~SubmissionStateMachine();

    // Captures the environment snapshot and tier
    bool initialize(PipelineError& error);

    bool start_calibration(PipelineError& error);
    bool complete_calibration(const CalibrationSnapshot& snapshot, PipelineError& error);
    bool start_recording(PipelineError& error);
    bool stop_recording(PipelineError& error);
    bool recording_available(const std::string& file_name, const std::string& mime_type,
                             std::shared_ptr<const std::vector<uint8_t>> data, PipelineError& error);
    bool attach_file(const std::string& file_name, const std::string& mime_type,
                     std::shared_ptr<const std::vector<uint8_t>> data, PipelineError& error);
    bool update_transcript(const std::string& transcript, PipelineError& error);

    // Starts the submission. Completion is reported through events and
    // get_state(); the return value only says whether the command was accepted.
    bool submit(const FieldList& form_fields, PipelineError& error);

    // External collaborator reported a hard failure (capture, DSP, ...)
    void fail(const PipelineError& cause);

    bool reset(PipelineError& error);

    const ApplicationState& get_state() const { return state; }
    SubmissionStatus get_status() const { return state.status; }
    const std::string& get_instance_id() const { return state.instance_id; }

    static const char* status_to_string(SubmissionStatus status) {
        return submission_status_to_string(status);
    }

private:
    void transition_state(SubmissionStatus new_state, const std::string& reason);
    bool require(std::initializer_list<SubmissionStatus> allowed, const char* command,
                 PipelineError& error) const;
    bool accept_payload(const char* kind, const std::string& file_name, const std::string& mime_type,
                        std::shared_ptr<const std::vector<uint8_t>> data, PipelineError& error);

    UploadRequest build_request(const SubmissionRecord& record) const;
    SubmissionRecord build_record(const std::string& submission_id) const;

    void on_upload_progress(uint64_t generation, int64_t uploaded, int64_t total);
    void on_upload_done(uint64_t generation, const SubmissionRecord& record,
                        const UploadResult& result);

    // Writes the artifact to the queue after a failed or skipped upload
    void enqueue(const SubmissionRecord& record, const PipelineError& cause, bool attempted);

    // Late failure of a submission whose instance was reset or destroyed
    static void preserve_abandoned(PersistentQueue* queue, const SubmissionRecord& record,
                                   const UploadResult& result);

    void publish(PipelineEventType type, const std::string& message);

    PipelineServices services;
    ApplicationState state;
    uint64_t generation;        // bumped by reset(); stale callbacks compare against it
};

#endif // SUBMISSION_STATE_MACHINE_H
