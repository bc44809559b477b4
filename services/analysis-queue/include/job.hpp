#pragma once
#include <chrono>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class JobStatus {
    Pending,            // waiting in queue
    Processing,         // claimed by the worker
    Success,
    Failed,             // no automatic retry left
    RetryScheduled,     // waiting for the automatic retry delay
    ManualRetryPending  // user asked for a retry, waiting in queue
};

const char* job_status_name(JobStatus s);
// Success or failed with no automatic retry left.
bool is_terminal(JobStatus s);

// "<token>:q<index>"
std::string make_job_id(const std::string& token, int question_index);

struct JobPayload {
    std::string folder;         // upload folder of the session
    std::string question_text;  // question shown to the candidate
    std::string video_path;     // recorded answer
    int duration_seconds{0};    // 0 when unknown
};

struct JobRetryInfo {
    int auto_retry_attempt{0}; // 0 or 1
    std::optional<TimePoint> auto_retry_scheduled_at;
    std::string last_error;
};

struct Job {
    std::string id;
    std::string token;
    int question_index{0};
    JobPayload payload;

    TimePoint created_at{};
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    JobStatus status{JobStatus::Pending};

    JobRetryInfo retry;

    std::optional<std::string> result; // raw JSON from the analyzer
    std::string error_message;
    bool is_manual_retry{false};
};
