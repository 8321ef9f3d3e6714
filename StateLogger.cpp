#include "StateLogger.h"
#include <ctime>
#include <sys/stat.h>

StateLogger& StateLogger::instance() {
    static StateLogger inst;
    return inst;
}

StateLogger::StateLogger()
    : log_file(nullptr),
      current_size(0)
{
}

StateLogger::~StateLogger() {
    close();
}

bool StateLogger::init(const std::string& log_dir) {
    close();
    log_filepath = log_dir + "/submission_states.log";

    log_file = fopen(log_filepath.c_str(), "a");
    if (!log_file) {
        fprintf(stderr, "Failed to open state log: %s\n", log_filepath.c_str());
        return false;
    }

    struct stat st;
    if (stat(log_filepath.c_str(), &st) == 0) {
        current_size = st.st_size;
    }

    log_event("========================================");
    log_event("State Logger Started");
    log_event("========================================");
    return true;
}

void StateLogger::close() {
    if (log_file) {
        fclose(log_file);
        log_file = nullptr;
    }
    current_size = 0;
}

void StateLogger::rotate_if_needed() {
    if (current_size < MAX_LOG_SIZE) {
        return;
    }

    fclose(log_file);
    log_file = nullptr;

    for (int i = MAX_ROTATIONS - 1; i > 0; i--) {
        std::string old_name = log_filepath + "." + std::to_string(i);
        std::string new_name = log_filepath + "." + std::to_string(i + 1);
        rename(old_name.c_str(), new_name.c_str());
    }

    std::string backup_name = log_filepath + ".1";
    rename(log_filepath.c_str(), backup_name.c_str());

    log_file = fopen(log_filepath.c_str(), "a");
    current_size = 0;
}

void StateLogger::write_timestamp() {
    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);

    char timestamp[64];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_info);

    int written = fprintf(log_file, "[%s] ", timestamp);
    if (written > 0) {
        current_size += written;
    }
}

void StateLogger::log_event(const char* format, ...) {
    if (!log_file) return;

    rotate_if_needed();
    if (!log_file) return;

    write_timestamp();

    va_list args;
    va_start(args, format);
    int written = vfprintf(log_file, format, args);
    va_end(args);

    fprintf(log_file, "\n");
    fflush(log_file);

    if (written > 0) {
        current_size += written + 1;
    }
}

void StateLogger::flush() {
    if (log_file) {
        fflush(log_file);
    }
}
