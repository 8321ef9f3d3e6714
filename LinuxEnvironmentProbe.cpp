#include "LinuxEnvironmentProbe.h"
#include "ConfigManager.h"
#include "Utility.h"
#include "logger.h"

#include <dirent.h>
#include <fstream>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

LinuxProbeOptions LinuxProbeOptions::from_config(const ConfigManager& cfg)
{
    LinuxProbeOptions o;

    std::string db_file = cfg.get_database_file();
    size_t slash = db_file.find_last_of('/');
    o.storage_path = (slash == std::string::npos) ? "." : db_file.substr(0, slash);
    if (o.storage_path.empty()) {
        o.storage_path = "/";
    }

    o.effective_type = cfg.get("network.effective_type", o.effective_type);
    o.downlink_mbps = cfg.get("network.downlink_mbps", o.downlink_mbps);
    o.rtt_ms = cfg.get("network.rtt_ms", o.rtt_ms);
    o.save_data = cfg.get("network.save_data", o.save_data);

    std::string capture = to_lower_copy(cfg.get("device.capture_available", std::string("auto")));
    if (capture == "true" || capture == "yes" || capture == "1") {
        o.capture_override = 1;
    } else if (capture == "false" || capture == "no" || capture == "0") {
        o.capture_override = 0;
    }

    o.user_agent = "clip_uplink/" + cfg.get_version();
    return o;
}

LinuxEnvironmentProbe::LinuxEnvironmentProbe(const LinuxProbeOptions& opts)
    : options(opts)
{
}

bool LinuxEnvironmentProbe::has_capture_device() const
{
    DIR* dir = opendir(options.sound_device_dir.c_str());
    if (!dir) {
        return false;
    }

    // ALSA capture PCM nodes are named pcmC<card>D<device>c
    bool found = false;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name.compare(0, 4, "pcmC") == 0 && !name.empty() && name.back() == 'c') {
            found = true;
            break;
        }
    }
    closedir(dir);
    return found;
}

bool LinuxEnvironmentProbe::probe(CapabilityDescriptor& out)
{
    CapabilityDescriptor d;

    bool capture = (options.capture_override < 0) ? has_capture_device()
                                                   : (options.capture_override == 1);
    d.has_recorder_api = capture;
    d.has_realtime_api = capture;

    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages > 0 && page_size > 0) {
        d.device_memory_gb = (double)pages * (double)page_size / (1024.0 * 1024.0 * 1024.0);
    }

    long cores = sysconf(_SC_NPROCESSORS_ONLN);
    d.logical_cores = cores > 0 ? static_cast<int>(cores) : 0;

    d.effective_type = options.effective_type;
    d.downlink_mbps = options.downlink_mbps;
    d.rtt_ms = options.rtt_ms;
    d.save_data = options.save_data;

    struct statvfs vfs;
    if (!options.storage_path.empty() && statvfs(options.storage_path.c_str(), &vfs) == 0) {
        d.storage_available_bytes = (int64_t)vfs.f_bavail * (int64_t)vfs.f_frsize;
    } else {
        LOG_WARN_CTX("env_probe", "statvfs failed for %s", options.storage_path.c_str());
    }

    struct utsname uts;
    d.user_agent = options.user_agent;
    if (uname(&uts) == 0) {
        d.user_agent += std::string(" (") + uts.sysname + "; " + uts.machine + ")";
    }

    if (capture) {
        bool accessible = access(options.sound_device_dir.c_str(), R_OK | X_OK) == 0;
        d.mic_permission = accessible ? MIC_GRANTED : MIC_DENIED;
    }

    LOG_INFO_CTX("env_probe", "Probe: capture=%s memory=%.1fGB cores=%d storage=%lldMB "
                 "net=%s/%.2fMbps/%dms", capture ? "yes" : "no", d.device_memory_gb,
                 d.logical_cores, (long long)(d.storage_available_bytes / (1024 * 1024)),
                 d.effective_type.c_str(), d.downlink_mbps, d.rtt_ms);
    out = d;
    return true;
}

bool LinuxEnvironmentProbe::link_is_up()
{
    DIR* dir = opendir(options.net_class_dir.c_str());
    if (!dir) {
        // No sysfs (containers, non-Linux): assume reachable and let requests decide
        return true;
    }

    bool up = false;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == ".." || name == "lo") {
            continue;
        }
        std::ifstream state(options.net_class_dir + "/" + name + "/operstate");
        std::string value;
        if (state >> value && (value == "up" || value == "unknown")) {
            up = true;
            break;
        }
    }
    closedir(dir);
    return up;
}
