#include "SubmissionTypes.h"

const char* tier_to_string(Tier tier)
{
    switch (tier) {
        case TIER_A: return "A";
        case TIER_B: return "B";
        case TIER_C: return "C";
        default: return "UNKNOWN";
    }
}

bool tier_from_string(const std::string& text, Tier& out)
{
    if (text == "A" || text == "a") { out = TIER_A; return true; }
    if (text == "B" || text == "b") { out = TIER_B; return true; }
    if (text == "C" || text == "c") { out = TIER_C; return true; }
    return false;
}

const char* quality_to_string(ConnectionQuality quality)
{
    switch (quality) {
        case QUALITY_VERY_LOW: return "very_low";
        case QUALITY_LOW: return "low";
        case QUALITY_HIGH: return "high";
        default: return "unknown";
    }
}

const char* record_status_to_string(RecordStatus status)
{
    switch (status) {
        case RECORD_PENDING: return "pending";
        case RECORD_UPLOADING: return "uploading";
        case RECORD_FAILED: return "failed";
        case RECORD_DONE: return "done";
        default: return "unknown";
    }
}

RecordStatus record_status_from_string(const std::string& text)
{
    if (text == "uploading") return RECORD_UPLOADING;
    if (text == "failed") return RECORD_FAILED;
    if (text == "done") return RECORD_DONE;
    return RECORD_PENDING;
}

const char* strategy_to_string(UploadStrategy strategy)
{
    switch (strategy) {
        case STRATEGY_NONE: return "NONE";
        case STRATEGY_RESUMABLE: return "RESUMABLE";
        case STRATEGY_SINGLE_SHOT: return "SINGLE_SHOT";
        case STRATEGY_CHUNKED: return "CHUNKED";
        default: return "UNKNOWN";
    }
}

const char* breaker_state_to_string(BreakerState state)
{
    switch (state) {
        case BREAKER_CLOSED: return "CLOSED";
        case BREAKER_OPEN: return "OPEN";
        case BREAKER_HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

const char* submission_status_to_string(SubmissionStatus status)
{
    switch (status) {
        case SUB_UNINITIALIZED: return "UNINITIALIZED";
        case SUB_IDLE: return "IDLE";
        case SUB_CALIBRATING: return "CALIBRATING";
        case SUB_RECORDING: return "RECORDING";
        case SUB_PROCESSING: return "PROCESSING";
        case SUB_READY_TO_SUBMIT: return "READY_TO_SUBMIT";
        case SUB_SUBMITTING: return "SUBMITTING";
        case SUB_COMPLETE: return "COMPLETE";
        case SUB_QUEUED: return "QUEUED";
        case SUB_ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* decision_to_string(RetryDecision decision)
{
    switch (decision) {
        case DECISION_RETRY: return "RETRY";
        case DECISION_HALT: return "HALT";
        case DECISION_PAUSE: return "PAUSE";
        default: return "UNKNOWN";
    }
}
