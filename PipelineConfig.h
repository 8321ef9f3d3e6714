#ifndef PIPELINE_CONFIG_H
#define PIPELINE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>
#include "SubmissionTypes.h"

class ConfigManager;

// Resolved runtime settings. Built once from ConfigManager and handed to
// the pipeline components by value or const reference.
struct PipelineConfig {
    PipelineConfig();

    static PipelineConfig from_config(const ConfigManager& cfg);

    // Logs every value (call after init_logger)
    void log_values() const;

    // queue.*
    std::string database_file;
    int max_retries;
    int64_t max_blob_size_bytes;
    int64_t max_total_bytes;
    int max_age_hours;

    // upload.*
    bool resumable_enabled;
    std::string resumable_endpoint;
    std::string direct_endpoint;
    std::string chunked_endpoint;           // chunk-per-POST fallback
    int64_t chunk_size;                     // 0 = tier table
    std::vector<int64_t> retry_delays_ms;   // empty = tier tables
    FieldList headers;
    int64_t resumable_threshold_bytes;

    // retry.* / breaker.*
    int live_attempts;
    int base_delay_ms;
    int cap_multiplier;
    double jitter_factor;
    int breaker_threshold;
    int64_t breaker_timeout_ms;

    // sync.*
    int sync_period_seconds;
    int sync_startup_delay_ms;
};

#endif // PIPELINE_CONFIG_H
