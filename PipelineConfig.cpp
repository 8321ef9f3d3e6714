#include "PipelineConfig.h"
#include "ConfigManager.h"
#include "PipelineConstants.h"
#include "Utility.h"
#include "logger.h"

PipelineConfig::PipelineConfig()
    : database_file("./clip_uplink.db"),
      max_retries(PipelineDefaults::MAX_RETRIES),
      max_blob_size_bytes(PipelineDefaults::MAX_BLOB_SIZE_BYTES),
      max_total_bytes(PipelineDefaults::MAX_TOTAL_QUEUE_BYTES),
      max_age_hours(PipelineDefaults::MAX_RECORD_AGE_HOURS),
      resumable_enabled(true),
      chunk_size(0),
      resumable_threshold_bytes(PipelineDefaults::RESUMABLE_THRESHOLD_BYTES),
      live_attempts(PipelineDefaults::LIVE_UPLOAD_ATTEMPTS),
      base_delay_ms(PipelineDefaults::BACKOFF_BASE_DELAY_MS),
      cap_multiplier(PipelineDefaults::BACKOFF_CAP_MULTIPLIER),
      jitter_factor(PipelineDefaults::BACKOFF_JITTER_FACTOR),
      breaker_threshold(PipelineDefaults::BREAKER_FAILURE_THRESHOLD),
      breaker_timeout_ms(PipelineDefaults::BREAKER_TIMEOUT_MS),
      sync_period_seconds(PipelineDefaults::SYNC_PERIOD_SECONDS),
      sync_startup_delay_ms(PipelineDefaults::SYNC_STARTUP_DELAY_MS)
{
}

PipelineConfig PipelineConfig::from_config(const ConfigManager& cfg)
{
    PipelineConfig c;

    c.database_file = cfg.get_database_file();
    c.max_retries = cfg.get("queue.max_retries", c.max_retries);
    c.max_blob_size_bytes = cfg.get("queue.max_blob_size_bytes", c.max_blob_size_bytes);
    c.max_total_bytes = cfg.get("queue.max_total_bytes", c.max_total_bytes);
    c.max_age_hours = cfg.get("queue.max_age_hours", c.max_age_hours);

    c.resumable_enabled = cfg.is_resumable_enabled();
    c.resumable_endpoint = cfg.get_resumable_endpoint();
    c.direct_endpoint = cfg.get_direct_endpoint();
    c.chunked_endpoint = cfg.get_chunked_endpoint();
    c.chunk_size = cfg.get("upload.chunk_size", c.chunk_size);
    c.resumable_threshold_bytes = cfg.get("upload.resumable_threshold_bytes",
                                          c.resumable_threshold_bytes);

    std::string delays = cfg.get_retry_delays();
    if (!delays.empty() && !parse_int_list(delays, c.retry_delays_ms)) {
        LOG_WARN_CTX("config", "upload.retry_delays='%s' is not a list of non-negative "
                     "integers, using tier tables", delays.c_str());
    }
    c.headers = parse_header_list(cfg.get_upload_headers());

    c.live_attempts = cfg.get("retry.live_attempts", c.live_attempts);
    c.base_delay_ms = cfg.get("retry.base_delay_ms", c.base_delay_ms);
    c.cap_multiplier = cfg.get("retry.cap_multiplier", c.cap_multiplier);
    c.jitter_factor = cfg.get("retry.jitter_factor", c.jitter_factor);
    c.breaker_threshold = cfg.get("breaker.threshold", c.breaker_threshold);
    c.breaker_timeout_ms = cfg.get("breaker.timeout_ms", c.breaker_timeout_ms);

    c.sync_period_seconds = cfg.get("sync.period_seconds", c.sync_period_seconds);
    c.sync_startup_delay_ms = cfg.get("sync.startup_delay_ms", c.sync_startup_delay_ms);
    return c;
}

void PipelineConfig::log_values() const
{
    LOG_INFO("queue.database_file: %s", database_file.c_str());
    LOG_INFO("queue.max_retries: %d", max_retries);
    LOG_INFO("queue.max_blob_size_bytes: %lld", (long long)max_blob_size_bytes);
    LOG_INFO("queue.max_total_bytes: %lld", (long long)max_total_bytes);
    LOG_INFO("queue.max_age_hours: %d", max_age_hours);
    LOG_INFO("upload.resumable_enabled: %s", resumable_enabled ? "true" : "false");
    LOG_INFO("upload.resumable_endpoint: %s",
             resumable_endpoint.empty() ? "(none)" : resumable_endpoint.c_str());
    LOG_INFO("upload.direct_endpoint: %s",
             direct_endpoint.empty() ? "(none)" : direct_endpoint.c_str());
    LOG_INFO("upload.chunked_endpoint: %s",
             chunked_endpoint.empty() ? "(none)" : chunked_endpoint.c_str());
    LOG_INFO("upload.chunk_size: %lld%s", (long long)chunk_size,
             chunk_size > 0 ? "" : " (tier table)");
    LOG_INFO("upload.retry_delays: %zu entries%s", retry_delays_ms.size(),
             retry_delays_ms.empty() ? " (tier tables)" : "");
    LOG_INFO("upload.headers: %zu", headers.size());
    LOG_INFO("retry.live_attempts: %d", live_attempts);
    LOG_INFO("retry.base_delay_ms: %d", base_delay_ms);
    LOG_INFO("breaker.threshold: %d", breaker_threshold);
    LOG_INFO("breaker.timeout_ms: %lld", (long long)breaker_timeout_ms);
    LOG_INFO("sync.period_seconds: %d", sync_period_seconds);
    LOG_INFO("sync.startup_delay_ms: %d", sync_startup_delay_ms);
}
