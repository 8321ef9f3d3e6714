#include "UploadTimeoutManager.h"
#include "Clock.h"
#include "PipelineConstants.h"
#include "TierClassifier.h"
#include <algorithm>

UploadTimeoutManager::UploadTimeoutManager(const Clock& clk)
    : clock(clk)
{
    reset();
}

UploadTimeoutManager::~UploadTimeoutManager()
{
}

void UploadTimeoutManager::start_attempt()
{
    attempt_start_ms = clock.now_ms();
    last_progress_ms = attempt_start_ms;
}

void UploadTimeoutManager::mark_progress()
{
    last_progress_ms = clock.now_ms();
}

int64_t UploadTimeoutManager::get_ms_since_last_progress() const
{
    if (last_progress_ms == 0) {
        return 0;  // Attempt not started yet
    }
    return clock.now_ms() - last_progress_ms;
}

int64_t UploadTimeoutManager::get_ms_since_attempt_start() const
{
    if (attempt_start_ms == 0) {
        return 0;
    }
    return clock.now_ms() - attempt_start_ms;
}

int UploadTimeoutManager::get_request_timeout_ms(ConnectionQuality quality, RequestPhase phase,
                                                 int64_t payload_bytes) const
{
    AdaptiveTimeouts base = TierClassifier::timeouts_for(quality);
    if (phase == PHASE_INIT) {
        return base.init_ms;
    }

    // Large bodies on slow links must not be cut off by a fixed window
    int64_t megabytes = (payload_bytes + 1048575) / 1048576;
    int64_t timeout = (int64_t)base.upload_ms + megabytes * PipelineDefaults::TIMEOUT_PER_MEGABYTE_MS;
    return (int)std::min(timeout, (int64_t)600000);
}

int UploadTimeoutManager::get_progressive_timeout_ms(ConnectionQuality quality, RequestPhase phase,
                                                     int64_t payload_bytes, int attempt) const
{
    int base = get_request_timeout_ms(quality, phase, payload_bytes);
    if (attempt <= 0) {
        return base;
    }

    // +50% per repeat, never more than the retry ceiling above the base
    int ceiling = TierClassifier::timeouts_for(quality).retry_ms;
    int64_t extra = (int64_t)base * attempt / 2;
    return base + (int)std::min(extra, (int64_t)ceiling);
}

void UploadTimeoutManager::reset()
{
    attempt_start_ms = 0;
    last_progress_ms = 0;
}
