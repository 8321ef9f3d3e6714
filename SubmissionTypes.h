#ifndef SUBMISSION_TYPES_H
#define SUBMISSION_TYPES_H

#include <string>
#include <utility>
#include <vector>

// Ordered name/value list used for form fields and HTTP headers
typedef std::vector<std::pair<std::string, std::string>> FieldList;

// Device capability tier
enum Tier {
    TIER_A,         // Full capability
    TIER_B,         // Constrained memory or slow network
    TIER_C          // Minimal: single-shot transfers only
};

// Network quality bucket
enum ConnectionQuality {
    QUALITY_VERY_LOW,
    QUALITY_LOW,
    QUALITY_HIGH
};

// Lifecycle of a queued record
enum RecordStatus {
    RECORD_PENDING,     // Waiting for the next flush
    RECORD_UPLOADING,   // Attempt in progress
    RECORD_FAILED,      // Halted by a non-retryable error, kept for review
    RECORD_DONE
};

enum UploadStrategy {
    STRATEGY_NONE,
    STRATEGY_RESUMABLE,     // tus chunked transfer
    STRATEGY_SINGLE_SHOT,   // one multipart POST
    STRATEGY_CHUNKED        // one multipart POST per chunk, then finalize
};

enum BreakerState {
    BREAKER_CLOSED,
    BREAKER_OPEN,
    BREAKER_HALF_OPEN
};

// Per-instance application status
enum SubmissionStatus {
    SUB_UNINITIALIZED,
    SUB_IDLE,
    SUB_CALIBRATING,
    SUB_RECORDING,
    SUB_PROCESSING,
    SUB_READY_TO_SUBMIT,
    SUB_SUBMITTING,
    SUB_COMPLETE,
    SUB_QUEUED,
    SUB_ERROR
};

// What to do with a record after a failed attempt
enum RetryDecision {
    DECISION_RETRY,     // Count the failure and reschedule
    DECISION_HALT,      // Stop retrying, leave for manual review
    DECISION_PAUSE      // Breaker open, leave the record untouched
};

enum MicPermission {
    MIC_UNKNOWN,
    MIC_GRANTED,
    MIC_PROMPT,
    MIC_DENIED
};

struct AdaptiveTimeouts {
    int init_ms;
    int upload_ms;
    int retry_ms;
};

const char* tier_to_string(Tier tier);
bool tier_from_string(const std::string& text, Tier& out);
const char* quality_to_string(ConnectionQuality quality);
const char* record_status_to_string(RecordStatus status);
RecordStatus record_status_from_string(const std::string& text);
const char* strategy_to_string(UploadStrategy strategy);
const char* breaker_state_to_string(BreakerState state);
const char* submission_status_to_string(SubmissionStatus status);
const char* decision_to_string(RetryDecision decision);

#endif // SUBMISSION_TYPES_H
