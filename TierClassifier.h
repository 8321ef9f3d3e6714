#ifndef TIER_CLASSIFIER_H
#define TIER_CLASSIFIER_H

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "EnvironmentProbe.h"
#include "SubmissionTypes.h"

/**
 * Assigns a capability tier and a network quality bucket from the signals
 * an EnvironmentProbe reports.
 *
 * classify(), refine() and classify_network() are pure. detect() runs the
 * probe once and caches the result for the session; everything downstream
 * (chunk size, delay tables, timeouts) reads the cached values.
 */
class TierClassifier
{
public:
    // probe may be null when the caller feeds capabilities directly
    explicit TierClassifier(EnvironmentProbe* probe = nullptr);
    ~TierClassifier();

    static Tier classify(const CapabilityDescriptor& caps);

    // Storage and permission signals arrive late; they can only lower the tier
    static Tier refine(Tier tier, const CapabilityDescriptor& caps);

    static ConnectionQuality classify_network(const CapabilityDescriptor& caps);

    static bool is_embedded_webview(const std::string& user_agent);

    static AdaptiveTimeouts timeouts_for(ConnectionQuality quality);

    // Seconds to transfer `bytes`, with a safety margin
    static int estimate_upload_seconds(int64_t bytes, double downlink_mbps,
                                       const std::string& effective_type);

    // "~45s" or "~3 min"
    static std::string format_upload_estimate(int seconds);

    // Probe, classify, refine, cache. Returns false when the probe failed;
    // the cached result then assumes the weakest device.
    bool detect();

    void update_capabilities(const CapabilityDescriptor& caps);

    bool has_result() const { return detected; }
    Tier get_tier() const { return tier; }
    ConnectionQuality get_quality() const { return quality; }
    const CapabilityDescriptor& get_capabilities() const { return capabilities; }

    // Environment section of the submission metadata
    nlohmann::json environment_snapshot() const;

private:
    EnvironmentProbe* probe;
    CapabilityDescriptor capabilities;
    Tier tier;
    ConnectionQuality quality;
    bool detected;
};

#endif // TIER_CLASSIFIER_H
