// logger.cpp
#include "logger.h"
#include <iostream>
#include <cctype>
#include <sys/stat.h>
#include <errno.h>

static SimpleLogger* g_logger_instance = nullptr;

SimpleLogger* get_logger() {
    return g_logger_instance;
}

int log_level_from_string(const std::string& name) {
    std::string lower = name;
    for (char& c : lower) {
        c = std::tolower(static_cast<unsigned char>(c));
    }
    if (lower == "debug") return LOG_LEVEL_DEBUG;
    if (lower == "warn" || lower == "warning") return LOG_LEVEL_WARN;
    if (lower == "error") return LOG_LEVEL_ERROR;
    if (lower == "critical") return LOG_LEVEL_CRITICAL;
    return LOG_LEVEL_INFO;
}

bool init_logger(const std::string& log_directory, const std::string& level) {
    if (g_logger_instance) {
        return true;
    }

    if (mkdir(log_directory.c_str(), 0755) != 0 && errno != EEXIST) {
        std::cerr << "ERROR: Cannot create log directory: " << log_directory << std::endl;
        return false;
    }

    std::string main_log_path = log_directory + "/clip_uplink.log";
    // 20 MB per file, keep 10 rotated files
    g_logger_instance = new SimpleLogger(main_log_path.c_str(), 5120 * 4, 10);
    g_logger_instance->set_min_level(log_level_from_string(level));

    if (!g_logger_instance->is_open()) {
        std::cerr << "WARNING: Log file not writable, logging to stderr only: "
                  << main_log_path << std::endl;
    }
    return true;
}

void cleanup_logger() {
    if (g_logger_instance) {
        delete g_logger_instance;
        g_logger_instance = nullptr;
    }
}
