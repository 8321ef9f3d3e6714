#include "TierClassifier.h"
#include "PipelineConstants.h"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace {

// Embedded in-app browsers. Their recorder support is unreliable.
const char* const WEBVIEW_SIGNATURES[] = {
    "; wv)", "FBAN", "FBAV", "Instagram", "Line/", "MicroMessenger", "WebView"
};

bool is_2g(const std::string& effective_type)
{
    return effective_type == "slow-2g" || effective_type == "2g";
}

} // namespace

TierClassifier::TierClassifier(EnvironmentProbe* env_probe)
    : probe(env_probe),
      tier(TIER_C),
      quality(QUALITY_VERY_LOW),
      detected(false)
{
}

TierClassifier::~TierClassifier()
{
}

bool TierClassifier::is_embedded_webview(const std::string& user_agent)
{
    for (const char* signature : WEBVIEW_SIGNATURES) {
        if (user_agent.find(signature) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Tier TierClassifier::classify(const CapabilityDescriptor& caps)
{
    if (!caps.has_recorder_api || !caps.has_realtime_api) {
        return TIER_C;
    }
    if (caps.device_memory_gb >= 0.0 && caps.device_memory_gb < PipelineDefaults::TIER_C_MAX_MEMORY_GB) {
        return TIER_C;
    }
    if (caps.logical_cores > 0 && caps.logical_cores < PipelineDefaults::TIER_C_MAX_CORES) {
        return TIER_C;
    }
    if (is_embedded_webview(caps.user_agent)) {
        return TIER_C;
    }

    if (is_2g(caps.effective_type)) {
        return TIER_B;
    }
    if (caps.device_memory_gb >= 0.0 && caps.device_memory_gb < PipelineDefaults::TIER_B_MAX_MEMORY_GB) {
        return TIER_B;
    }
    return TIER_A;
}

Tier TierClassifier::refine(Tier current, const CapabilityDescriptor& caps)
{
    if (current == TIER_C) {
        return TIER_C;
    }
    if (caps.storage_available_bytes > 0 &&
        caps.storage_available_bytes < PipelineDefaults::MIN_STORAGE_BYTES) {
        return TIER_C;
    }
    if (caps.mic_permission == MIC_DENIED) {
        return TIER_C;
    }
    return current;
}

ConnectionQuality TierClassifier::classify_network(const CapabilityDescriptor& caps)
{
    // No signal at all: assume the worst
    if (caps.effective_type.empty() && caps.downlink_mbps <= 0.0 && caps.rtt_ms <= 0) {
        return QUALITY_VERY_LOW;
    }

    if (is_2g(caps.effective_type)) {
        return QUALITY_VERY_LOW;
    }
    if (caps.downlink_mbps > 0.0 && caps.downlink_mbps < PipelineDefaults::VERY_LOW_MAX_DOWNLINK_MBPS) {
        return QUALITY_VERY_LOW;
    }

    if (caps.effective_type == "3g") {
        return QUALITY_LOW;
    }
    if (caps.downlink_mbps > 0.0 && caps.downlink_mbps < PipelineDefaults::LOW_MAX_DOWNLINK_MBPS) {
        return QUALITY_LOW;
    }
    if (caps.rtt_ms > PipelineDefaults::LOW_MIN_RTT_MS) {
        return QUALITY_LOW;
    }
    return QUALITY_HIGH;
}

AdaptiveTimeouts TierClassifier::timeouts_for(ConnectionQuality q)
{
    AdaptiveTimeouts t;
    switch (q) {
        case QUALITY_VERY_LOW:
            t.init_ms = PipelineDefaults::TIMEOUT_VERY_LOW_INIT_MS;
            t.upload_ms = PipelineDefaults::TIMEOUT_VERY_LOW_UPLOAD_MS;
            t.retry_ms = PipelineDefaults::TIMEOUT_VERY_LOW_RETRY_MS;
            break;
        case QUALITY_LOW:
            t.init_ms = PipelineDefaults::TIMEOUT_LOW_INIT_MS;
            t.upload_ms = PipelineDefaults::TIMEOUT_LOW_UPLOAD_MS;
            t.retry_ms = PipelineDefaults::TIMEOUT_LOW_RETRY_MS;
            break;
        case QUALITY_HIGH:
        default:
            t.init_ms = PipelineDefaults::TIMEOUT_HIGH_INIT_MS;
            t.upload_ms = PipelineDefaults::TIMEOUT_HIGH_UPLOAD_MS;
            t.retry_ms = PipelineDefaults::TIMEOUT_HIGH_RETRY_MS;
            break;
    }
    return t;
}

int TierClassifier::estimate_upload_seconds(int64_t bytes, double downlink_mbps,
                                            const std::string& effective_type)
{
    if (bytes <= 0) {
        return 0;
    }

    double mbps = downlink_mbps;
    if (mbps <= 0.0) {
        if (effective_type == "slow-2g") {
            mbps = 0.05;
        } else if (effective_type == "2g") {
            mbps = 0.15;
        } else if (effective_type == "3g") {
            mbps = 0.75;
        } else if (effective_type == "4g") {
            mbps = 8.0;
        } else {
            mbps = 0.5;
        }
    }
    mbps = std::min(mbps, PipelineDefaults::ESTIMATE_MAX_DOWNLINK_MBPS);

    double bytes_per_second = mbps * 125000.0;
    double seconds = (double)bytes / bytes_per_second * PipelineDefaults::ESTIMATE_SAFETY_FACTOR;
    return static_cast<int>(std::ceil(seconds));
}

std::string TierClassifier::format_upload_estimate(int seconds)
{
    char buffer[32];
    if (seconds < 60) {
        snprintf(buffer, sizeof(buffer), "~%ds", seconds < 1 ? 1 : seconds);
    } else {
        snprintf(buffer, sizeof(buffer), "~%d min", (seconds + 59) / 60);
    }
    return buffer;
}

bool TierClassifier::detect()
{
    CapabilityDescriptor caps;
    bool ok = probe != nullptr && probe->probe(caps);
    if (!ok) {
        LOG_WARN_CTX("tier", "Capability probe unavailable, assuming minimal device");
    }
    update_capabilities(caps);
    return ok;
}

void TierClassifier::update_capabilities(const CapabilityDescriptor& caps)
{
    Tier previous = tier;
    bool had_result = detected;

    capabilities = caps;
    tier = refine(classify(caps), caps);
    quality = classify_network(caps);
    detected = true;

    if (!had_result || previous != tier) {
        LOG_INFO_CTX("tier", "Tier %s, connection %s (memory=%.1fGB cores=%d type=%s)",
                     tier_to_string(tier), quality_to_string(quality),
                     caps.device_memory_gb, caps.logical_cores,
                     caps.effective_type.empty() ? "unknown" : caps.effective_type.c_str());
    }
}

nlohmann::json TierClassifier::environment_snapshot() const
{
    nlohmann::json env;
    env["tier"] = tier_to_string(tier);
    env["connectionQuality"] = quality_to_string(quality);
    env["deviceMemory"] = capabilities.device_memory_gb;
    env["hardwareConcurrency"] = capabilities.logical_cores;
    env["effectiveType"] = capabilities.effective_type;
    env["downlink"] = capabilities.downlink_mbps;
    env["rtt"] = capabilities.rtt_ms;
    env["saveData"] = capabilities.save_data;
    env["storageAvailable"] = capabilities.storage_available_bytes;
    env["userAgent"] = capabilities.user_agent;
    env["recorder"] = capabilities.has_recorder_api;
    return env;
}
