#include "EventBus.h"
#include "logger.h"

#include <exception>

const char* event_type_to_string(PipelineEventType type)
{
    switch (type) {
        case EVENT_QUEUE_UPDATED: return "queue-updated";
        case EVENT_SUBMISSION_STARTED: return "submission-started";
        case EVENT_SUBMISSION_QUEUED: return "submission-queued";
        case EVENT_SUBMISSION_COMPLETE: return "submission-complete";
        case EVENT_SUBMISSION_FAILED: return "submission-failed";
        case EVENT_UPLOAD_PROGRESS: return "upload-progress";
        case EVENT_RETRIES_PAUSED: return "retries-paused";
        default: return "unknown";
    }
}

EventBus::EventBus()
    : next_id(1),
      listener_failures(0)
{
}

EventBus::~EventBus()
{
}

int EventBus::subscribe(Listener listener)
{
    int id = next_id++;
    listeners.push_back(std::make_pair(id, std::move(listener)));
    return id;
}

bool EventBus::unsubscribe(int subscription_id)
{
    for (auto it = listeners.begin(); it != listeners.end(); ++it) {
        if (it->first == subscription_id) {
            listeners.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const PipelineEvent& event)
{
    // Listeners may subscribe or unsubscribe while being notified
    std::vector<std::pair<int, Listener>> snapshot = listeners;

    for (size_t i = 0; i < snapshot.size(); i++) {
        try {
            snapshot[i].second(event);
        } catch (const std::exception& e) {
            listener_failures++;
            LOG_ERROR_CTX("event_bus", "Listener %d threw on %s: %s",
                          snapshot[i].first, event_type_to_string(event.type), e.what());
        }
    }
}
