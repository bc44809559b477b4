#include "test_common.h"

#include "job.hpp"

int main() {
    expect_eq_str(make_job_id("T1", 0), "T1:q0", "job id format");
    expect_eq_str(make_job_id("abc-123", 4), "abc-123:q4", "job id keeps token verbatim");

    expect_eq_str(job_status_name(JobStatus::RetryScheduled), "retry_scheduled", "retry_scheduled name");
    expect_eq_str(job_status_name(JobStatus::ManualRetryPending), "manual_retry_pending", "manual_retry_pending name");

    expect_true(is_terminal(JobStatus::Success), "success is terminal");
    expect_true(is_terminal(JobStatus::Failed), "failed is terminal");
    expect_true(!is_terminal(JobStatus::RetryScheduled), "retry_scheduled is not terminal");
    expect_true(!is_terminal(JobStatus::ManualRetryPending), "manual_retry_pending is not terminal");

    Job j;
    expect_true(j.status == JobStatus::Pending, "new job is pending");
    expect_eq_ll(j.retry.auto_retry_attempt, 0, "new job has no retry attempts");
    expect_true(!j.result && !j.started_at && !j.completed_at, "new job has no result or timestamps");
    return 0;
}
