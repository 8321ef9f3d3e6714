#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "PipelineServices.h"
#include "SubmissionStateMachine.h"

// Registry of submission instances. Commands are routed by instance id so
// instances never see each other's commands.
//
// A command that arrives while the same (command, instance) pair is still
// being processed (typically an event listener reacting to the command's
// own events) is dropped and logged.
class SessionManager
{
public:
    explicit SessionManager(const PipelineServices& services);
    ~SessionManager();

    // Creates and initializes an instance. Fails if the id is taken.
    std::shared_ptr<SubmissionStateMachine> create(const std::string& instance_id, PipelineError& error);
    std::shared_ptr<SubmissionStateMachine> get(const std::string& instance_id) const;
    bool destroy(const std::string& instance_id);

    size_t count() const { return machines.size(); }
    std::vector<std::string> instance_ids() const;

    // Commands
    bool start_calibration(const std::string& instance_id, PipelineError& error);
    bool complete_calibration(const std::string& instance_id, const CalibrationSnapshot& snapshot,
                              PipelineError& error);
    bool start_recording(const std::string& instance_id, PipelineError& error);
    bool stop_recording(const std::string& instance_id, PipelineError& error);
    bool recording_available(const std::string& instance_id, const std::string& file_name,
                             const std::string& mime_type,
                             std::shared_ptr<const std::vector<uint8_t>> data, PipelineError& error);
    bool attach_file(const std::string& instance_id, const std::string& file_name,
                     const std::string& mime_type,
                     std::shared_ptr<const std::vector<uint8_t>> data, PipelineError& error);
    bool update_transcript(const std::string& instance_id, const std::string& transcript,
                           PipelineError& error);
    bool submit(const std::string& instance_id, const FieldList& form_fields, PipelineError& error);
    bool fail(const std::string& instance_id, const PipelineError& cause, PipelineError& error);
    bool reset(const std::string& instance_id, PipelineError& error);

    int get_dropped_commands() const { return dropped_commands; }

private:
    typedef std::function<bool(SubmissionStateMachine&, PipelineError&)> Command;

    bool dispatch(const char* command, const std::string& instance_id, Command action,
                  PipelineError& error);

    PipelineServices services;
    std::map<std::string, std::shared_ptr<SubmissionStateMachine>> machines;
    std::set<std::pair<std::string, std::string>> in_progress;   // (command, instance id)
    int dropped_commands;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
};

#endif // SESSION_MANAGER_H
