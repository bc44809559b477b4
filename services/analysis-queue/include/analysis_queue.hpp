#pragma once
#include "analyzer.hpp"
#include "job.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

constexpr int kMaxAutoRetries = 1;

enum class RetryDecision { ScheduleAutoRetry, GiveUp };

// Every failure kind is retried the same way: once, automatically.
RetryDecision decide_retry(int auto_retry_attempt, AnalysisErrorKind kind);

struct QueueConfig {
    std::chrono::milliseconds auto_retry_delay{std::chrono::seconds(70)};
};

struct JobStatusReport {
    Job job;
    // Jobs ahead in the FIFO. Empty when the job is not queued. Jobs waiting
    // on a retry timer are not counted.
    std::optional<std::size_t> position;
};

struct JobSummary {
    std::string id;
    JobStatus status{JobStatus::Pending};
    TimePoint created_at{};
    bool is_manual_retry{false};
    std::optional<TimePoint> auto_retry_scheduled_at;
};

struct QueueSnapshot {
    std::size_t size{0}; // queued plus waiting on a retry timer
    std::optional<std::string> current_job;
    bool processing{false};
    std::optional<TimePoint> last_job_started_at;
    std::vector<JobSummary> jobs;      // FIFO order
    std::vector<JobSummary> scheduled; // waiting on a retry timer
};

class AnalysisQueue {
public:
    using NowFn = std::function<TimePoint()>;
    using CompletionListener = std::function<void(const Job&)>;

    explicit AnalysisQueue(QueueConfig cfg = {}, NowFn now = &Clock::now);

    // Admission. Idempotent on (token, question_index); returns the job id.
    std::string add(const std::string& token, int question_index, const JobPayload& payload,
                    bool manual_retry = false);

    // Promotes at most one expired retry to the front, then claims the head
    // (marking it processing). Empty while another job is processing.
    std::optional<Job> next();

    bool mark_success(const std::string& id, const std::string& result_json);
    bool mark_failed(const std::string& id, const AnalysisError& error);

    std::optional<JobStatusReport> status(const std::string& id);
    QueueSnapshot snapshot();
    bool is_processing();
    // Jobs awaiting processing, including those waiting on a retry timer.
    std::size_t size();

    // Called after every recorded outcome, outside the queue lock.
    void set_completion_listener(CompletionListener listener);

private:
    void remove_from_fifo(const std::string& id);
    void remove_from_retry_wait(const std::string& id);
    void schedule_auto_retry(Job& job, TimePoint now);
    void notify(const Job& job);

    QueueConfig cfg_;
    NowFn now_;

    std::mutex mtx_;
    std::deque<std::string> fifo_;
    std::vector<std::string> retry_wait_; // scheduling order
    std::unordered_map<std::string, Job> jobs_;
    std::optional<std::string> current_;
    std::optional<TimePoint> last_started_;

    std::mutex listener_mtx_;
    CompletionListener listener_;
};
