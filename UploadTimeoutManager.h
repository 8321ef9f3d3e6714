#ifndef UPLOAD_TIMEOUT_MANAGER_H
#define UPLOAD_TIMEOUT_MANAGER_H

#include <cstdint>
#include "SubmissionTypes.h"

class Clock;

// Note: base timeouts live in PipelineConstants.h (TIMEOUT_* values)

enum RequestPhase {
    PHASE_INIT,      // session create, HEAD, anything without payload
    PHASE_UPLOAD     // PATCH chunk or multipart POST
};

class UploadTimeoutManager
{
public:
    explicit UploadTimeoutManager(const Clock& clock);
    ~UploadTimeoutManager();

    // Start tracking a new attempt
    void start_attempt();

    // Called after every committed chunk
    void mark_progress();

    int64_t get_ms_since_last_progress() const;
    int64_t get_ms_since_attempt_start() const;

    // Timeout for one request. Payload requests get extra time per megabyte.
    int get_request_timeout_ms(ConnectionQuality quality, RequestPhase phase,
                               int64_t payload_bytes) const;

    // Stretches the timeout on repeated attempts of the same request, bounded
    // by the quality's retry ceiling on top of the base value
    int get_progressive_timeout_ms(ConnectionQuality quality, RequestPhase phase,
                                   int64_t payload_bytes, int attempt) const;

    void reset();

private:
    const Clock& clock;
    int64_t attempt_start_ms;
    int64_t last_progress_ms;
};

#endif // UPLOAD_TIMEOUT_MANAGER_H
