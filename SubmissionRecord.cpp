#include "SubmissionRecord.h"

using json = nlohmann::json;

json SubmissionMetadata::to_json() const
{
    json j;
    j["calibration"] = {
        {"complete", calibration.complete},
        {"gain", calibration.gain},
        {"speechLevel", calibration.speech_level}
    };
    j["environment"] = environment;
    j["transcript"] = transcript;
    j["tier"] = tier_to_string(tier);
    return j;
}

bool SubmissionMetadata::from_json(const json& j, SubmissionMetadata& out)
{
    if (!j.is_object()) {
        return false;
    }

    SubmissionMetadata m;
    auto cal = j.find("calibration");
    if (cal != j.end() && cal->is_object()) {
        m.calibration.complete = cal->value("complete", false);
        m.calibration.gain = cal->value("gain", 1.0);
        m.calibration.speech_level = cal->value("speechLevel", 0.0);
    }

    auto env = j.find("environment");
    if (env != j.end() && env->is_object()) {
        m.environment = *env;
    }

    m.transcript = j.value("transcript", std::string());

    Tier tier = TIER_A;
    if (tier_from_string(j.value("tier", std::string("A")), tier)) {
        m.tier = tier;
    }

    out = m;
    return true;
}

json form_fields_to_json(const FieldList& fields)
{
    // Array of pairs keeps insertion order
    json arr = json::array();
    for (size_t i = 0; i < fields.size(); i++) {
        arr.push_back(json::array({fields[i].first, fields[i].second}));
    }
    return arr;
}

bool form_fields_from_json(const json& j, FieldList& out)
{
    if (!j.is_array()) {
        return false;
    }
    FieldList fields;
    for (const auto& item : j) {
        if (!item.is_array() || item.size() != 2 ||
            !item[0].is_string() || !item[1].is_string()) {
            return false;
        }
        fields.push_back(std::make_pair(item[0].get<std::string>(),
                                        item[1].get<std::string>()));
    }
    out.swap(fields);
    return true;
}
