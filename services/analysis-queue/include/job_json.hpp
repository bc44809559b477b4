#pragma once
#include "analysis_queue.hpp"
#include "job.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct EnqueueRequest {
    std::string token;
    int question_index{0};
    JobPayload payload;
    bool manual_retry{false};
};

// Throws nlohmann::json::exception when a required field is missing or has
// the wrong type.
EnqueueRequest parse_enqueue_request(const nlohmann::json& j);

nlohmann::json job_to_json(const Job& job);
nlohmann::json status_to_json(const JobStatusReport& report);
nlohmann::json snapshot_to_json(const QueueSnapshot& s);
