#ifndef PIPELINE_ERROR_H
#define PIPELINE_ERROR_H

#include <cstdint>
#include <string>

enum ErrorKind {
    ERR_NONE,
    ERR_CONFIGURATION,       // Endpoint or other required setting missing
    ERR_VALIDATION,          // Input rejected before any I/O
    ERR_PAYLOAD_TOO_LARGE,   // Exceeds the blob cap, or server answered 413
    ERR_NETWORK,             // Transport failure or timeout
    ERR_SERVER_4XX,
    ERR_SERVER_5XX,
    ERR_MALFORMED_RESPONSE,  // Server answered but the body/headers are unusable
    ERR_STORAGE_QUOTA,
    ERR_STORAGE_IO,
    ERR_CIRCUIT_OPEN,
    ERR_REENTRANCY_GUARD
};

struct PipelineError {
    ErrorKind kind;
    int http_status;
    std::string message;

    PipelineError() : kind(ERR_NONE), http_status(0) {}
    PipelineError(ErrorKind k, const std::string& msg, int status = 0)
        : kind(k), http_status(status), message(msg) {}

    bool ok() const { return kind == ERR_NONE; }

    // Network errors and 5xx may succeed on a later attempt
    bool is_retryable() const;

    // Only transport failures and 5xx move the circuit breaker
    bool counts_as_breaker_failure() const { return is_retryable(); }

    std::string to_string() const;

    // Maps a non-2xx status to its error kind
    static PipelineError from_http_status(int status, const std::string& context);
};

const char* error_kind_to_string(ErrorKind kind);

// Text shown to the person who made the recording.
// retry_in_ms is only used for ERR_CIRCUIT_OPEN.
std::string describe_for_user(const PipelineError& error, int64_t retry_in_ms = 0);

#endif // PIPELINE_ERROR_H
