#ifndef LOGGER_H
#define LOGGER_H

#include <stdio.h>
#include <stdarg.h>
#include <time.h>
#include <sys/time.h>
#include <string.h>
#include <pthread.h>
#include <string>

enum LogLevel {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO,
    LOG_LEVEL_WARN,
    LOG_LEVEL_ERROR,
    LOG_LEVEL_CRITICAL
};

class SimpleLogger {
private:
    FILE* log_file;
    char log_path[256];
    size_t max_file_size;
    int max_files;
    int min_level;
    bool echo_console;
    pthread_mutex_t log_mutex;

    void rotate_logs() {
        fclose(log_file);

        // app.log.3 -> app.log.4, ..., app.log.0 -> app.log.1
        char old_name[300], new_name[300];
        for (int i = max_files - 1; i > 0; i--) {
            snprintf(old_name, sizeof(old_name), "%s.%d", log_path, i - 1);
            snprintf(new_name, sizeof(new_name), "%s.%d", log_path, i);
            rename(old_name, new_name);
        }

        snprintf(new_name, sizeof(new_name), "%s.0", log_path);
        rename(log_path, new_name);

        log_file = fopen(log_path, "a");
    }

    void check_rotation() {
        if (log_file) {
            fseek(log_file, 0, SEEK_END);
            long size = ftell(log_file);
            if (size >= (long)max_file_size) {
                rotate_logs();
            }
        }
    }

    void log_internal(int level, const char* level_name, const char* context,
                      const char* format, va_list args) {
        if (level < min_level) {
            return;
        }

        pthread_mutex_lock(&log_mutex);

        check_rotation();

        struct timeval tv;
        gettimeofday(&tv, NULL);
        struct tm tm_info;
        localtime_r(&tv.tv_sec, &tm_info);

        char timestamp[64];
        strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_info);

        va_list args2;
        va_copy(args2, args);

        if (log_file) {
            fprintf(log_file, "%s,%03ld - %s - %s - ",
                    timestamp, tv.tv_usec / 1000, context, level_name);
            vfprintf(log_file, format, args);
            fprintf(log_file, "\n");
            fflush(log_file);
        }

        if (echo_console) {
            fprintf(stderr, "%s,%03ld - %s - %s - ",
                    timestamp, tv.tv_usec / 1000, context, level_name);
            vfprintf(stderr, format, args2);
            fprintf(stderr, "\n");
            fflush(stderr);
        }

        va_end(args2);

        pthread_mutex_unlock(&log_mutex);
    }

public:
    SimpleLogger(const char* path, size_t max_size_kb = 256, int num_files = 5)
        : max_file_size(max_size_kb * 1024), max_files(num_files),
          min_level(LOG_LEVEL_DEBUG), echo_console(true) {
        strncpy(log_path, path, sizeof(log_path) - 1);
        log_path[sizeof(log_path) - 1] = '\0';
        log_file = fopen(log_path, "a");
        pthread_mutex_init(&log_mutex, NULL);
    }

    ~SimpleLogger() {
        if (log_file) {
            fclose(log_file);
        }
        pthread_mutex_destroy(&log_mutex);
    }

    SimpleLogger(const SimpleLogger&) = delete;
    SimpleLogger& operator=(const SimpleLogger&) = delete;

    bool is_open() const { return log_file != NULL; }
    void set_min_level(int level) { min_level = level; }
    void set_echo_console(bool enable) { echo_console = enable; }

    void debug(const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_DEBUG, "DEBUG", "clip_uplink", format, args);
        va_end(args);
    }

    void debug_ctx(const char* context, const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_DEBUG, "DEBUG", context, format, args);
        va_end(args);
    }

    void info(const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_INFO, "INFO", "clip_uplink", format, args);
        va_end(args);
    }

    void info_ctx(const char* context, const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_INFO, "INFO", context, format, args);
        va_end(args);
    }

    void warn(const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_WARN, "WARN", "clip_uplink", format, args);
        va_end(args);
    }

    void warn_ctx(const char* context, const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_WARN, "WARN", context, format, args);
        va_end(args);
    }

    void error(const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_ERROR, "ERROR", "clip_uplink", format, args);
        va_end(args);
    }

    void error_ctx(const char* context, const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_ERROR, "ERROR", context, format, args);
        va_end(args);
    }

    void critical(const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_CRITICAL, "CRITICAL", "clip_uplink", format, args);
        va_end(args);
    }

    void critical_ctx(const char* context, const char* format, ...) {
        va_list args;
        va_start(args, format);
        log_internal(LOG_LEVEL_CRITICAL, "CRITICAL", context, format, args);
        va_end(args);
    }
};

// Get logger instance (defined in logger.cpp). Null until init_logger() runs.
SimpleLogger* get_logger();

// Initialize logger - call this once in main() with log directory from config
bool init_logger(const std::string& log_directory = "./logs",
                 const std::string& level = "info");
void cleanup_logger();

// Parses "debug", "info", "warn", "error", "critical"; unknown names give INFO
int log_level_from_string(const std::string& name);

// Standard macros (default context: clip_uplink)
#define LOG_DEBUG(...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->debug(__VA_ARGS__); \
} while(0)

#define LOG_INFO(...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->info(__VA_ARGS__); \
} while(0)

#define LOG_WARN(...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->warn(__VA_ARGS__); \
} while(0)

#define LOG_ERROR(...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->error(__VA_ARGS__); \
} while(0)

#define LOG_CRITICAL(...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->critical(__VA_ARGS__); \
} while(0)

// Context macros (custom context)
#define LOG_DEBUG_CTX(context, ...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->debug_ctx(context, __VA_ARGS__); \
} while(0)

#define LOG_INFO_CTX(context, ...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->info_ctx(context, __VA_ARGS__); \
} while(0)

#define LOG_WARN_CTX(context, ...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->warn_ctx(context, __VA_ARGS__); \
} while(0)

#define LOG_ERROR_CTX(context, ...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->error_ctx(context, __VA_ARGS__); \
} while(0)

#define LOG_CRITICAL_CTX(context, ...) do { \
    SimpleLogger* logger = get_logger(); \
    if (logger) logger->critical_ctx(context, __VA_ARGS__); \
} while(0)

#endif // LOGGER_H
