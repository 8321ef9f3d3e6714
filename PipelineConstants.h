#ifndef PIPELINE_CONSTANTS_H
#define PIPELINE_CONSTANTS_H

#include <cstdint>

/**
 * @file PipelineConstants.h
 * @brief Default limits, delay tables and timeouts for the submission pipeline
 *
 * Constants are organized by functional area. Every value that an operator
 * may want to change is also exposed through a config key (see PipelineConfig);
 * the values here are the defaults used when the key is absent.
 */

namespace PipelineDefaults {

//=============================================================================
// QUEUE LIMITS
//=============================================================================

// Automatic flush gives up on a record after this many failed attempts.
// The record stays in the store for manual review.
constexpr int MAX_RETRIES = 10;

// Largest artifact accepted into the queue (40 MB)
constexpr int64_t MAX_BLOB_SIZE_BYTES = 41943040;

// Total payload bytes the queue may hold before reporting a quota error (256 MB)
constexpr int64_t MAX_TOTAL_QUEUE_BYTES = 268435456;

// Records that exhausted their retries are purged after this age (7 days)
constexpr int MAX_RECORD_AGE_HOURS = 168;

//=============================================================================
// TRANSFER STRATEGY
//=============================================================================

// Blobs larger than this use the resumable path when it is available
constexpr int64_t RESUMABLE_THRESHOLD_BYTES = 1048576;

// Per-tier chunk sizes for resumable PATCH requests
constexpr int64_t CHUNK_SIZE_TIER_A_HIGH = 4194304;   // 4 MB
constexpr int64_t CHUNK_SIZE_TIER_A_LOW  = 1048576;   // 1 MB
constexpr int64_t CHUNK_SIZE_TIER_B_HIGH = 524288;    // 512 KB
constexpr int64_t CHUNK_SIZE_TIER_B_LOW  = 262144;    // 256 KB
constexpr int64_t CHUNK_SIZE_MINIMAL     = 131072;    // 128 KB, tier C and very_low links

// A chunk is retried this many times before the attempt fails
constexpr int MAX_CHUNK_RETRIES          = 10;
constexpr int MAX_CHUNK_RETRIES_VERY_LOW = 15;

// Per-chunk retry waits (ms), indexed by retry number, last entry repeats
constexpr int64_t CHUNK_RETRY_DELAYS_MS[] = {0, 5000, 15000, 45000, 120000, 300000};
constexpr int64_t CHUNK_RETRY_DELAYS_VERY_LOW_MS[] = {0, 10000, 30000, 60000, 180000, 300000, 600000};

// Upload-Metadata values are truncated to this many characters
constexpr int METADATA_VALUE_MAX_CHARS = 500;

// tus protocol version sent in every request
constexpr const char* TUS_VERSION = "1.0.0";

//=============================================================================
// QUEUE FLUSH DELAYS
//=============================================================================
// Minimum time since the last attempt before a queued record is retried,
// indexed by the record's retry count. The last entry repeats.

constexpr int64_t FLUSH_DELAYS_MS[] = {
    0, 5000, 10000, 30000, 60000, 120000, 300000, 600000, 1200000, 1800000
};

// Used for tier C devices and very_low connections
constexpr int64_t FLUSH_DELAYS_SLOW_MS[] = {
    0, 10000, 30000, 60000, 180000, 300000, 600000
};

//=============================================================================
// LIVE RETRY BACKOFF
//=============================================================================
// delay = base * min(2^attempt, cap) * (1 + jitter * random())

constexpr int LIVE_UPLOAD_ATTEMPTS = 2;
constexpr int BACKOFF_BASE_DELAY_MS = 1000;
constexpr int BACKOFF_CAP_MULTIPLIER = 8;
constexpr double BACKOFF_JITTER_FACTOR = 0.1;

//=============================================================================
// CIRCUIT BREAKER
//=============================================================================

constexpr int BREAKER_FAILURE_THRESHOLD = 5;
constexpr int64_t BREAKER_TIMEOUT_MS = 300000;   // 5 minutes

//=============================================================================
// ADAPTIVE REQUEST TIMEOUTS
//=============================================================================
// init: session create/HEAD. upload: request carrying payload bytes.
// retry: ceiling used by progressive timeouts on repeated attempts.

constexpr int TIMEOUT_VERY_LOW_INIT_MS   = 10000;
constexpr int TIMEOUT_VERY_LOW_UPLOAD_MS = 60000;
constexpr int TIMEOUT_VERY_LOW_RETRY_MS  = 30000;

constexpr int TIMEOUT_LOW_INIT_MS   = 5000;
constexpr int TIMEOUT_LOW_UPLOAD_MS = 30000;
constexpr int TIMEOUT_LOW_RETRY_MS  = 15000;

constexpr int TIMEOUT_HIGH_INIT_MS   = 2000;
constexpr int TIMEOUT_HIGH_UPLOAD_MS = 15000;
constexpr int TIMEOUT_HIGH_RETRY_MS  = 5000;

// Payload requests get at least this much time per megabyte on top of the base
constexpr int TIMEOUT_PER_MEGABYTE_MS = 4000;

//=============================================================================
// DEVICE CLASSIFICATION
//=============================================================================

// Devices with less free storage than this are downgraded to tier C (80 MB)
constexpr int64_t MIN_STORAGE_BYTES = 83886080;

constexpr double TIER_C_MAX_MEMORY_GB = 1.0;
constexpr double TIER_B_MAX_MEMORY_GB = 2.0;
constexpr int    TIER_C_MAX_CORES = 2;

// Network quality thresholds
constexpr double VERY_LOW_MAX_DOWNLINK_MBPS = 0.5;
constexpr double LOW_MAX_DOWNLINK_MBPS = 2.0;
constexpr int    LOW_MIN_RTT_MS = 1000;

// Upload-time estimate
constexpr double ESTIMATE_MAX_DOWNLINK_MBPS = 10.0;
constexpr double ESTIMATE_SAFETY_FACTOR = 1.5;

//=============================================================================
// SYNC TRIGGER
//=============================================================================

constexpr int SYNC_PERIOD_SECONDS = 60;
constexpr int SYNC_STARTUP_DELAY_MS = 2000;

// How often the daemon re-reads link state
constexpr int CONNECTIVITY_POLL_MS = 5000;

} // namespace PipelineDefaults

#endif // PIPELINE_CONSTANTS_H
