#ifndef LINUX_ENVIRONMENT_PROBE_H
#define LINUX_ENVIRONMENT_PROBE_H

#include <string>
#include "EnvironmentProbe.h"

class ConfigManager;

struct LinuxProbeOptions {
    std::string storage_path;       // statvfs target, normally the queue directory
    std::string sound_device_dir;   // ALSA device nodes
    std::string net_class_dir;      // link state
    std::string effective_type;
    double downlink_mbps;
    int rtt_ms;
    bool save_data;
    int capture_override;           // -1 detect, 0 absent, 1 present
    std::string user_agent;

    LinuxProbeOptions()
        : sound_device_dir("/dev/snd"), net_class_dir("/sys/class/net"),
          effective_type("4g"), downlink_mbps(10.0), rtt_ms(100), save_data(false),
          capture_override(-1) {}

    static LinuxProbeOptions from_config(const ConfigManager& cfg);
};

// Reads memory/cores from sysconf, free space from statvfs, capture
// devices from /dev/snd and link state from /sys/class/net. Connection
// quality cannot be measured passively and comes from configuration.
class LinuxEnvironmentProbe : public EnvironmentProbe
{
public:
    explicit LinuxEnvironmentProbe(const LinuxProbeOptions& options);

    bool probe(CapabilityDescriptor& out) override;
    bool link_is_up() override;

private:
    bool has_capture_device() const;

    LinuxProbeOptions options;
};

#endif // LINUX_ENVIRONMENT_PROBE_H
