#ifndef SUBMISSION_RECORD_H
#define SUBMISSION_RECORD_H

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "SubmissionTypes.h"

struct CalibrationSnapshot {
    bool complete;
    double gain;
    double speech_level;

    CalibrationSnapshot() : complete(false), gain(1.0), speech_level(0.0) {}
};

// Structured metadata travelling with the artifact
struct SubmissionMetadata {
    CalibrationSnapshot calibration;
    nlohmann::json environment;     // TierClassifier::environment_snapshot()
    std::string transcript;
    Tier tier;

    SubmissionMetadata() : environment(nlohmann::json::object()), tier(TIER_A) {}

    nlohmann::json to_json() const;
    static bool from_json(const nlohmann::json& j, SubmissionMetadata& out);
};

struct SubmissionRecord {
    std::string id;
    std::string instance_id;
    std::string file_name;
    std::string mime_type;
    std::vector<uint8_t> payload;
    FieldList form_fields;
    SubmissionMetadata metadata;
    int64_t created_at;
    int retry_count;
    int64_t last_attempt_at;        // 0 = never attempted
    std::string last_error;
    RecordStatus status;

    SubmissionRecord()
        : created_at(0), retry_count(0), last_attempt_at(0), status(RECORD_PENDING) {}
};

// Payload-free view published with queue-updated events
struct QueueEntrySummary {
    std::string id;
    std::string file_name;
    int retry_count;
    std::string error;
    int64_t created_at;
    int64_t last_attempt_at;
    int64_t payload_size;
    RecordStatus status;

    QueueEntrySummary()
        : retry_count(0), created_at(0), last_attempt_at(0), payload_size(0),
          status(RECORD_PENDING) {}
};

nlohmann::json form_fields_to_json(const FieldList& fields);
bool form_fields_from_json(const nlohmann::json& j, FieldList& out);

#endif // SUBMISSION_RECORD_H
