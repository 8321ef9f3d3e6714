// MainLoopConstants.h
// Timing constants for the clip_uplink main loop and the ranges that
// validate_config() enforces on the configuration file.

#ifndef MAIN_LOOP_CONSTANTS_H
#define MAIN_LOOP_CONSTANTS_H

#include <cstdint>

// ===== Main loop =====

// Sleep when a loop pass found nothing to do (milliseconds)
constexpr int MAIN_LOOP_IDLE_SLEEP_MS = 20;

// How often stale resumable sessions are dropped from the session store
constexpr int SESSION_EXPIRY_CHECK_INTERVAL_SEC = 3600;

// Resumable sessions untouched for this long are forgotten (hours)
constexpr int SESSION_MAX_AGE_HOURS = 24;

// One-shot commands (--submit, --flush) give up after this long
constexpr int ONE_SHOT_TIMEOUT_SEC = 1800;


// ===== Configuration Validation Ranges =====

// queue.max_retries
constexpr int MAX_RETRIES_MIN = 1;
constexpr int MAX_RETRIES_MAX = 100;

// queue.max_blob_size_bytes
constexpr int64_t BLOB_SIZE_MIN_BYTES = 1024;                        // 1 KB
constexpr int64_t BLOB_SIZE_MAX_BYTES = 1024LL * 1024 * 1024;        // 1 GB

// queue.max_age_hours
constexpr int MAX_AGE_MIN_HOURS = 1;
constexpr int MAX_AGE_MAX_HOURS = 24 * 90;                          // 90 days

// upload.chunk_size (0 selects the tier table)
constexpr int64_t CHUNK_SIZE_MIN_BYTES = 16 * 1024;
constexpr int64_t CHUNK_SIZE_MAX_BYTES = 64LL * 1024 * 1024;

// retry.*
constexpr int LIVE_ATTEMPTS_MIN = 1;
constexpr int LIVE_ATTEMPTS_MAX = 10;
constexpr int BASE_DELAY_MIN_MS = 10;
constexpr int BASE_DELAY_MAX_MS = 60000;
constexpr int CAP_MULTIPLIER_MIN = 1;
constexpr int CAP_MULTIPLIER_MAX = 1024;

// breaker.*
constexpr int BREAKER_THRESHOLD_MIN = 1;
constexpr int BREAKER_THRESHOLD_MAX = 100;
constexpr int64_t BREAKER_TIMEOUT_MIN_MS = 1000;
constexpr int64_t BREAKER_TIMEOUT_MAX_MS = 24LL * 3600 * 1000;

// sync.*
constexpr int SYNC_PERIOD_MIN_SEC = 0;              // 0 disables the periodic flush
constexpr int SYNC_PERIOD_MAX_SEC = 86400;
constexpr int SYNC_STARTUP_DELAY_MAX_MS = 600000;

#endif // MAIN_LOOP_CONSTANTS_H
