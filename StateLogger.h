#ifndef STATE_LOGGER_H
#define STATE_LOGGER_H

#include <cstdio>
#include <string>
#include <cstdarg>

// Transition and outcome log for submissions and queue flushes.
// Writes submission_states.log with rotation; silent until init() succeeds.
class StateLogger {
public:
    static StateLogger& instance();

    bool init(const std::string& log_dir);
    void close();
    bool is_open() const { return log_file != nullptr; }

    void log_event(const char* format, ...);

    void flush();

private:
    StateLogger();
    ~StateLogger();

    void rotate_if_needed();
    void write_timestamp();

    std::string log_filepath;
    FILE* log_file;
    size_t current_size;

    static const size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB
    static const int MAX_ROTATIONS = 5;

    StateLogger(const StateLogger&) = delete;
    StateLogger& operator=(const StateLogger&) = delete;
};

#define LOG_STATE(...) StateLogger::instance().log_event(__VA_ARGS__)

#endif // STATE_LOGGER_H
