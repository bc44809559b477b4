#include "job_json.hpp"
#include "util.hpp"

using json = nlohmann::json;

namespace {
json time_or_null(const std::optional<TimePoint>& t) {
    return t ? json(format_time(*t)) : json(nullptr);
}

json summary_to_json(const JobSummary& s) {
    return json{
        {"job_id", s.id},
        {"status", job_status_name(s.status)},
        {"created_at", format_time(s.created_at)},
        {"is_manual_retry", s.is_manual_retry},
        {"auto_retry_scheduled_at", time_or_null(s.auto_retry_scheduled_at)}
    };
}
}

EnqueueRequest parse_enqueue_request(const json& j) {
    EnqueueRequest r;
    r.token = j.at("token").get<std::string>();
    r.question_index = j.at("question_index").get<int>();
    r.payload.folder = j.value("folder", std::string());
    r.payload.question_text = j.value("question_text", std::string());
    r.payload.video_path = j.at("video_path").get<std::string>();
    r.payload.duration_seconds = j.value("duration_seconds", 0);
    r.manual_retry = j.value("manual_retry", false);
    return r;
}

json job_to_json(const Job& job) {
    json result = nullptr;
    if (job.result) {
        // Results are stored as raw JSON text; embed them as objects when they parse.
        result = json::parse(*job.result, nullptr, false);
        if (result.is_discarded()) result = *job.result;
    }
    return json{
        {"job_id", job.id},
        {"token", job.token},
        {"question_index", job.question_index},
        {"folder", job.payload.folder},
        {"question_text", job.payload.question_text},
        {"video_path", job.payload.video_path},
        {"status", job_status_name(job.status)},
        {"finished", is_terminal(job.status)},
        {"created_at", format_time(job.created_at)},
        {"started_at", time_or_null(job.started_at)},
        {"completed_at", time_or_null(job.completed_at)},
        {"retry_info", {
            {"auto_retry_attempt", job.retry.auto_retry_attempt},
            {"auto_retry_scheduled_at", time_or_null(job.retry.auto_retry_scheduled_at)},
            {"last_error", job.retry.last_error}
        }},
        {"result", result},
        {"error_message", job.error_message},
        {"is_manual_retry", job.is_manual_retry}
    };
}

json status_to_json(const JobStatusReport& report) {
    json j = job_to_json(report.job);
    j["queue_position"] = report.position ? json(*report.position) : json(nullptr);
    return j;
}

json snapshot_to_json(const QueueSnapshot& s) {
    json jobs = json::array();
    for (const auto& j : s.jobs) jobs.push_back(summary_to_json(j));
    json scheduled = json::array();
    for (const auto& j : s.scheduled) scheduled.push_back(summary_to_json(j));
    return json{
        {"queue_size", s.size},
        {"current_job", s.current_job ? json(*s.current_job) : json(nullptr)},
        {"processing", s.processing},
        {"last_job_started_at", time_or_null(s.last_job_started_at)},
        {"jobs", jobs},
        {"scheduled_retries", scheduled}
    };
}
