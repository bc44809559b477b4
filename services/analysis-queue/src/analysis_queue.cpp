#include "analysis_queue.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

RetryDecision decide_retry(int auto_retry_attempt, AnalysisErrorKind /*kind*/) {
    return auto_retry_attempt < kMaxAutoRetries ? RetryDecision::ScheduleAutoRetry : RetryDecision::GiveUp;
}

AnalysisQueue::AnalysisQueue(QueueConfig cfg, NowFn now) : cfg_(cfg), now_(std::move(now)) {}

std::string AnalysisQueue::add(const std::string& token, int question_index, const JobPayload& payload,
                               bool manual_retry) {
    std::string id = make_job_id(token, question_index);
    std::lock_guard<std::mutex> lock(mtx_);
    TimePoint now = now_();

    auto it = jobs_.find(id);
    if (it != jobs_.end()) {
        Job& existing = it->second;
        if (existing.status == JobStatus::Processing) {
            std::cout << "[queue] " << (manual_retry ? "Manual" : "Auto") << " retry for " << id
                      << " ignored, job is processing" << std::endl;
            return id;
        }
        remove_from_fifo(id);
        remove_from_retry_wait(id);
        if (manual_retry) {
            // Back of the queue. The automatic retry counter is kept.
            existing.status = JobStatus::ManualRetryPending;
            existing.is_manual_retry = true;
            existing.result.reset();
            existing.error_message.clear();
            existing.completed_at.reset();
            fifo_.push_back(id);
            std::cout << "[queue] Manual retry for " << id << ", position: " << fifo_.size() << std::endl;
        } else {
            existing.retry.auto_retry_attempt = std::min(existing.retry.auto_retry_attempt + 1, kMaxAutoRetries);
            existing.is_manual_retry = false;
            schedule_auto_retry(existing, now);
            std::cout << "[queue] Auto-retry scheduled for " << id << " at "
                      << format_time(*existing.retry.auto_retry_scheduled_at) << std::endl;
        }
        return id;
    }

    Job job;
    job.id = id;
    job.token = token;
    job.question_index = question_index;
    job.payload = payload;
    job.created_at = now;
    job.status = manual_retry ? JobStatus::ManualRetryPending : JobStatus::Pending;
    job.is_manual_retry = manual_retry;
    jobs_.emplace(id, std::move(job));
    fifo_.push_back(id);
    std::cout << "[queue] Added job " << id << ", queue size: " << fifo_.size() + retry_wait_.size() << std::endl;
    return id;
}

std::optional<Job> AnalysisQueue::next() {
    std::lock_guard<std::mutex> lock(mtx_);
    TimePoint now = now_();

    // An expired automatic retry jumps ahead of everything already queued.
    for (auto it = retry_wait_.begin(); it != retry_wait_.end(); ++it) {
        Job& job = jobs_.at(*it);
        if (job.retry.auto_retry_scheduled_at && now >= *job.retry.auto_retry_scheduled_at) {
            job.status = JobStatus::Pending;
            job.retry.auto_retry_scheduled_at.reset();
            fifo_.push_front(job.id);
            retry_wait_.erase(it);
            std::cout << "[queue] Job " << job.id << " retry delay expired, moving to front of queue" << std::endl;
            break;
        }
    }

    if (current_ || fifo_.empty()) return std::nullopt;

    Job& head = jobs_.at(fifo_.front());
    if (head.status != JobStatus::Pending && head.status != JobStatus::ManualRetryPending) {
        return std::nullopt;
    }
    fifo_.pop_front();
    head.status = JobStatus::Processing;
    head.started_at = now;
    current_ = head.id;
    last_started_ = now;
    return head;
}

bool AnalysisQueue::mark_success(const std::string& id, const std::string& result_json) {
    Job done;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.status != JobStatus::Processing) {
            std::cerr << "[queue] mark_success for " << id << " ignored, job is not processing" << std::endl;
            return false;
        }
        Job& job = it->second;
        job.status = JobStatus::Success;
        job.result = result_json;
        job.completed_at = now_();
        current_.reset();
        done = job;
    }
    std::cout << "[queue] Job " << id << " completed successfully" << std::endl;
    notify(done);
    return true;
}

bool AnalysisQueue::mark_failed(const std::string& id, const AnalysisError& error) {
    Job done;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.status != JobStatus::Processing) {
            std::cerr << "[queue] mark_failed for " << id << " ignored, job is not processing" << std::endl;
            return false;
        }
        Job& job = it->second;
        TimePoint now = now_();
        job.error_message = error.message;
        job.retry.last_error = error.message;
        current_.reset();

        if (decide_retry(job.retry.auto_retry_attempt, error.kind) == RetryDecision::ScheduleAutoRetry) {
            ++job.retry.auto_retry_attempt;
            schedule_auto_retry(job, now);
            std::cout << "[queue] Job " << id << " failed (" << analysis_error_kind_name(error.kind)
                      << "), auto-retry scheduled for " << format_time(*job.retry.auto_retry_scheduled_at)
                      << std::endl;
        } else {
            job.status = JobStatus::Failed;
            job.completed_at = now;
            std::cout << "[queue] Job " << id << " failed permanently: " << error.message << std::endl;
        }
        done = job;
    }
    notify(done);
    return true;
}

std::optional<JobStatusReport> AnalysisQueue::status(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    JobStatusReport r{it->second, std::nullopt};
    auto pos = std::find(fifo_.begin(), fifo_.end(), id);
    if (pos != fifo_.end()) r.position = static_cast<std::size_t>(pos - fifo_.begin());
    return r;
}

QueueSnapshot AnalysisQueue::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    auto summarize = [&](const std::string& id) {
        const Job& j = jobs_.at(id);
        return JobSummary{j.id, j.status, j.created_at, j.is_manual_retry, j.retry.auto_retry_scheduled_at};
    };
    QueueSnapshot s;
    s.size = fifo_.size() + retry_wait_.size();
    s.current_job = current_;
    s.processing = current_.has_value();
    s.last_job_started_at = last_started_;
    s.jobs.reserve(fifo_.size());
    for (const auto& id : fifo_) s.jobs.push_back(summarize(id));
    s.scheduled.reserve(retry_wait_.size());
    for (const auto& id : retry_wait_) s.scheduled.push_back(summarize(id));
    return s;
}

bool AnalysisQueue::is_processing() {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_.has_value();
}

std::size_t AnalysisQueue::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return fifo_.size() + retry_wait_.size();
}

void AnalysisQueue::set_completion_listener(CompletionListener listener) {
    std::lock_guard<std::mutex> lock(listener_mtx_);
    listener_ = std::move(listener);
}

void AnalysisQueue::remove_from_fifo(const std::string& id) {
    auto it = std::find(fifo_.begin(), fifo_.end(), id);
    if (it != fifo_.end()) fifo_.erase(it);
}

// Cancels a pending automatic retry. The attempt counter is kept.
void AnalysisQueue::remove_from_retry_wait(const std::string& id) {
    auto it = std::find(retry_wait_.begin(), retry_wait_.end(), id);
    if (it == retry_wait_.end()) return;
    retry_wait_.erase(it);
    jobs_.at(id).retry.auto_retry_scheduled_at.reset();
}

void AnalysisQueue::schedule_auto_retry(Job& job, TimePoint now) {
    job.status = JobStatus::RetryScheduled;
    job.retry.auto_retry_scheduled_at = now + cfg_.auto_retry_delay;
    retry_wait_.push_back(job.id);
}

void AnalysisQueue::notify(const Job& job) {
    CompletionListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mtx_);
        listener = listener_;
    }
    if (!listener) return;
    try {
        listener(job);
    } catch (const std::exception& e) {
        std::cerr << "[queue] Completion listener failed for " << job.id << ": " << e.what() << std::endl;
    }
}
