#include "SessionManager.h"
#include "StateLogger.h"
#include "logger.h"

namespace {

// Marks a (command, instance) pair busy for the lifetime of the guard
class CommandGuard
{
public:
    CommandGuard(std::set<std::pair<std::string, std::string>>& busy_set,
                 const std::pair<std::string, std::string>& pair_key)
        : busy(busy_set), key(pair_key)
    {
        busy.insert(key);
    }

    ~CommandGuard()
    {
        busy.erase(key);
    }

private:
    std::set<std::pair<std::string, std::string>>& busy;
    std::pair<std::string, std::string> key;

    CommandGuard(const CommandGuard&) = delete;
    CommandGuard& operator=(const CommandGuard&) = delete;
};

} // namespace

SessionManager::SessionManager(const PipelineServices& pipeline)
    : services(pipeline),
      dropped_commands(0)
{
    LOG_INFO_CTX("session_mgr", "SessionManager initialized");
}

SessionManager::~SessionManager()
{
}

std::shared_ptr<SubmissionStateMachine> SessionManager::create(const std::string& instance_id,
                                                               PipelineError& error)
{
    if (instance_id.empty()) {
        error = PipelineError(ERR_VALIDATION, "Instance id is empty");
        return nullptr;
    }
    if (machines.count(instance_id) > 0) {
        error = PipelineError(ERR_VALIDATION, "Instance " + instance_id + " already exists");
        return nullptr;
    }

    std::shared_ptr<SubmissionStateMachine> machine =
        std::make_shared<SubmissionStateMachine>(instance_id, services);
    machines[instance_id] = machine;

    bool ok = dispatch("initialize", instance_id,
                       [](SubmissionStateMachine& m, PipelineError& e) { return m.initialize(e); },
                       error);
    if (!ok) {
        machines.erase(instance_id);
        return nullptr;
    }

    LOG_STATE("INSTANCE CREATED: %s", instance_id.c_str());
    return machine;
}

std::shared_ptr<SubmissionStateMachine> SessionManager::get(const std::string& instance_id) const
{
    auto it = machines.find(instance_id);
    return (it != machines.end()) ? it->second : nullptr;
}

bool SessionManager::destroy(const std::string& instance_id)
{
    if (machines.erase(instance_id) == 0) {
        return false;
    }
    LOG_STATE("INSTANCE DESTROYED: %s", instance_id.c_str());
    return true;
}

std::vector<std::string> SessionManager::instance_ids() const
{
    std::vector<std::string> ids;
    for (const auto& entry : machines) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool SessionManager::dispatch(const char* command, const std::string& instance_id, Command action,
                              PipelineError& error)
{
    std::pair<std::string, std::string> key(command, instance_id);
    if (in_progress.count(key) > 0) {
        dropped_commands++;
        error = PipelineError(ERR_REENTRANCY_GUARD,
                              std::string(command) + " already in progress for " + instance_id);
        LOG_WARN_CTX("session_mgr", "Dropped re-entrant command: %s", error.message.c_str());
        return false;
    }

    // Hold a reference: the command may destroy() its own instance
    std::shared_ptr<SubmissionStateMachine> machine = get(instance_id);
    if (!machine) {
        error = PipelineError(ERR_VALIDATION, "Unknown instance " + instance_id);
        LOG_WARN_CTX("session_mgr", "%s: %s", command, error.message.c_str());
        return false;
    }

    CommandGuard guard(in_progress, key);
    return action(*machine, error);
}

bool SessionManager::start_calibration(const std::string& instance_id, PipelineError& error)
{
    return dispatch("start_calibration", instance_id,
                    [](SubmissionStateMachine& m, PipelineError& e) { return m.start_calibration(e); },
                    error);
}

bool SessionManager::complete_calibration(const std::string& instance_id,
                                          const CalibrationSnapshot& snapshot, PipelineError& error)
{
    return dispatch("complete_calibration", instance_id,
                    [&snapshot](SubmissionStateMachine& m, PipelineError& e) {
                        return m.complete_calibration(snapshot, e);
                    },
                    error);
}

bool SessionManager::start_recording(const std::string& instance_id, PipelineError& error)
{
    return dispatch("start_recording", instance_id,
                    [](SubmissionStateMachine& m, PipelineError& e) { return m.start_recording(e); },
                    error);
}

bool SessionManager::stop_recording(const std::string& instance_id, PipelineError& error)
{
    return dispatch("stop_recording", instance_id,
                    [](SubmissionStateMachine& m, PipelineError& e) { return m.stop_recording(e); },
                    error);
}

bool SessionManager::recording_available(const std::string& instance_id, const std::string& file_name,
                                         const std::string& mime_type,
                                         std::shared_ptr<const std::vector<uint8_t>> data,
                                         PipelineError& error)
{
    return dispatch("recording_available", instance_id,
                    [&](SubmissionStateMachine& m, PipelineError& e) {
                        return m.recording_available(file_name, mime_type, data, e);
                    },
                    error);
}

bool SessionManager::attach_file(const std::string& instance_id, const std::string& file_name,
                                 const std::string& mime_type,
                                 std::shared_ptr<const std::vector<uint8_t>> data, PipelineError& error)
{
    return dispatch("attach_file", instance_id,
                    [&](SubmissionStateMachine& m, PipelineError& e) {
                        return m.attach_file(file_name, mime_type, data, e);
                    },
                    error);
}

bool SessionManager::update_transcript(const std::string& instance_id, const std::string& transcript,
                                       PipelineError& error)
{
    return dispatch("update_transcript", instance_id,
                    [&transcript](SubmissionStateMachine& m, PipelineError& e) {
                        return m.update_transcript(transcript, e);
                    },
                    error);
}

bool SessionManager::submit(const std::string& instance_id, const FieldList& form_fields,
                            PipelineError& error)
{
    return dispatch("submit", instance_id,
                    [&form_fields](SubmissionStateMachine& m, PipelineError& e) {
                        return m.submit(form_fields, e);
                    },
                    error);
}

bool SessionManager::fail(const std::string& instance_id, const PipelineError& cause, PipelineError& error)
{
    return dispatch("fail", instance_id,
                    [&cause](SubmissionStateMachine& m, PipelineError&) {
                        m.fail(cause);
                        return true;
                    },
                    error);
}

bool SessionManager::reset(const std::string& instance_id, PipelineError& error)
{
    return dispatch("reset", instance_id,
                    [](SubmissionStateMachine& m, PipelineError& e) { return m.reset(e); },
                    error);
}
