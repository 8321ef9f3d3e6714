#ifndef EVENT_BUS_H
#define EVENT_BUS_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "SubmissionRecord.h"

enum PipelineEventType {
    EVENT_QUEUE_UPDATED,
    EVENT_SUBMISSION_STARTED,
    EVENT_SUBMISSION_QUEUED,
    EVENT_SUBMISSION_COMPLETE,
    EVENT_SUBMISSION_FAILED,
    EVENT_UPLOAD_PROGRESS,
    EVENT_RETRIES_PAUSED
};

struct PipelineEvent {
    PipelineEventType type;
    std::string instance_id;
    std::string submission_id;
    double progress;                        // EVENT_UPLOAD_PROGRESS, 0..1
    std::string message;                    // user-facing text
    int64_t timestamp;
    int64_t retry_in_ms;                    // EVENT_RETRIES_PAUSED
    std::vector<QueueEntrySummary> queue;   // EVENT_QUEUE_UPDATED

    explicit PipelineEvent(PipelineEventType t = EVENT_QUEUE_UPDATED)
        : type(t), progress(0.0), timestamp(0), retry_in_ms(0) {}
};

const char* event_type_to_string(PipelineEventType type);

// Delivers events to UI/telemetry listeners. A listener that throws is
// logged and skipped; the remaining listeners still run.
class EventBus
{
public:
    typedef std::function<void(const PipelineEvent&)> Listener;

    EventBus();
    ~EventBus();

    int subscribe(Listener listener);
    bool unsubscribe(int subscription_id);

    void publish(const PipelineEvent& event);

    size_t listener_count() const { return listeners.size(); }
    int get_listener_failures() const { return listener_failures; }

private:
    std::vector<std::pair<int, Listener>> listeners;
    int next_id;
    int listener_failures;
};

#endif // EVENT_BUS_H
