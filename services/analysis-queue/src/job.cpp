#include "job.hpp"

const char* job_status_name(JobStatus s) {
    switch (s) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Success: return "success";
        case JobStatus::Failed: return "failed";
        case JobStatus::RetryScheduled: return "retry_scheduled";
        case JobStatus::ManualRetryPending: return "manual_retry_pending";
    }
    return "pending";
}

bool is_terminal(JobStatus s) {
    return s == JobStatus::Success || s == JobStatus::Failed;
}

std::string make_job_id(const std::string& token, int question_index) {
    return token + ":q" + std::to_string(question_index);
}
