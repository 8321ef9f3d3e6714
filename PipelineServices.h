#ifndef PIPELINE_SERVICES_H
#define PIPELINE_SERVICES_H

#include "PipelineConfig.h"

class ConnectivityMonitor;
class EventBus;
class EventLoop;
class PersistentQueue;
class TierClassifier;
class UploadCoordinator;

// Shared collaborators handed to every submission instance. Not owned;
// main() (or the test fixture) keeps them alive for the pipeline's lifetime.
struct PipelineServices {
    PipelineConfig config;
    EventLoop* loop;
    EventBus* bus;
    TierClassifier* classifier;
    ConnectivityMonitor* connectivity;
    PersistentQueue* queue;
    UploadCoordinator* coordinator;

    PipelineServices()
        : loop(nullptr), bus(nullptr), classifier(nullptr), connectivity(nullptr),
          queue(nullptr), coordinator(nullptr) {}

    bool is_complete() const {
        return loop && bus && classifier && connectivity && queue && coordinator;
    }
};

#endif // PIPELINE_SERVICES_H
