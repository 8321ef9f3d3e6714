#ifndef ENVIRONMENT_PROBE_H
#define ENVIRONMENT_PROBE_H

#include <cstdint>
#include <string>
#include "SubmissionTypes.h"

// Capability signals the classifier works from. Unknown numeric values
// are negative (memory) or zero (cores, storage).
struct CapabilityDescriptor {
    bool has_recorder_api;
    bool has_realtime_api;
    double device_memory_gb;        // < 0: unknown
    int logical_cores;              // 0: unknown
    std::string effective_type;     // "slow-2g", "2g", "3g", "4g", "" unknown
    double downlink_mbps;           // <= 0: unknown
    int rtt_ms;                     // <= 0: unknown
    bool save_data;
    int64_t storage_available_bytes;   // 0: unknown
    std::string user_agent;
    MicPermission mic_permission;

    CapabilityDescriptor()
        : has_recorder_api(false), has_realtime_api(false), device_memory_gb(-1.0),
          logical_cores(0), downlink_mbps(0.0), rtt_ms(0), save_data(false),
          storage_available_bytes(0), mic_permission(MIC_UNKNOWN) {}
};

// Platform-specific capability detection
class EnvironmentProbe {
public:
    virtual ~EnvironmentProbe() {}

    virtual bool probe(CapabilityDescriptor& out) = 0;

    // Coarse link state for the connectivity monitor
    virtual bool link_is_up() = 0;
};

#endif // ENVIRONMENT_PROBE_H
