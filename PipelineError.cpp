#include "PipelineError.h"
#include <cstdio>

const char* error_kind_to_string(ErrorKind kind)
{
    switch (kind) {
        case ERR_NONE: return "NONE";
        case ERR_CONFIGURATION: return "CONFIGURATION";
        case ERR_VALIDATION: return "VALIDATION";
        case ERR_PAYLOAD_TOO_LARGE: return "PAYLOAD_TOO_LARGE";
        case ERR_NETWORK: return "NETWORK";
        case ERR_SERVER_4XX: return "SERVER_4XX";
        case ERR_SERVER_5XX: return "SERVER_5XX";
        case ERR_MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
        case ERR_STORAGE_QUOTA: return "STORAGE_QUOTA";
        case ERR_STORAGE_IO: return "STORAGE_IO";
        case ERR_CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case ERR_REENTRANCY_GUARD: return "REENTRANCY_GUARD";
        default: return "UNKNOWN";
    }
}

bool PipelineError::is_retryable() const
{
    return kind == ERR_NETWORK || kind == ERR_SERVER_5XX;
}

std::string PipelineError::to_string() const
{
    std::string out = error_kind_to_string(kind);
    if (http_status > 0) {
        out += " (HTTP " + std::to_string(http_status) + ")";
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

PipelineError PipelineError::from_http_status(int status, const std::string& context)
{
    char buffer[256];
    snprintf(buffer, sizeof(buffer), "%s returned HTTP %d", context.c_str(), status);

    if (status == 413) {
        return PipelineError(ERR_PAYLOAD_TOO_LARGE, buffer, status);
    }
    if (status >= 400 && status < 500) {
        return PipelineError(ERR_SERVER_4XX, buffer, status);
    }
    if (status >= 500) {
        return PipelineError(ERR_SERVER_5XX, buffer, status);
    }
    // 1xx/3xx where a 2xx was required
    return PipelineError(ERR_MALFORMED_RESPONSE, buffer, status);
}

std::string describe_for_user(const PipelineError& error, int64_t retry_in_ms)
{
    switch (error.kind) {
        case ERR_NONE:
            return "Submitted";
        case ERR_NETWORK:
        case ERR_SERVER_5XX:
            return "Saved offline, will retry automatically";
        case ERR_CIRCUIT_OPEN: {
            int64_t seconds = (retry_in_ms + 999) / 1000;
            return "Retries paused, the server is not responding. Next attempt in " +
                   std::to_string(seconds) + " s";
        }
        case ERR_PAYLOAD_TOO_LARGE:
            return "Recording is too large to upload. Record a shorter clip";
        case ERR_STORAGE_QUOTA:
            return "Device storage is full. Free some space and try again";
        case ERR_STORAGE_IO:
            return "Upload failed and could not be saved";
        case ERR_CONFIGURATION:
            return "Upload is not configured on this device. Contact support";
        case ERR_SERVER_4XX:
        case ERR_MALFORMED_RESPONSE:
            return "The server rejected this submission. It was kept for review";
        case ERR_VALIDATION:
            return "Submission is incomplete: " + error.message;
        case ERR_REENTRANCY_GUARD:
            return "A submission is already in progress";
        default:
            return error.message;
    }
}
