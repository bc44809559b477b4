#include "queue_worker.hpp"
#include <exception>
#include <iostream>
#include <utility>

QueueWorker::QueueWorker(AnalysisQueue& queue, Analyzer& analyzer, WorkerConfig cfg)
    : queue_(queue), analyzer_(analyzer), cfg_(cfg) {}

QueueWorker::~QueueWorker() {
    stop();
}

void QueueWorker::start() {
    if (running_.exchange(true)) {
        std::cerr << "[worker] Already running" << std::endl;
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mtx_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&QueueWorker::loop, this);
    std::cout << "[worker] Started (poll " << cfg_.poll.count() << "ms, interval "
              << cfg_.job_interval.count() << "ms)" << std::endl;
}

void QueueWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mtx_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        std::cout << "[worker] Stopped" << std::endl;
    }
    running_ = false;
}

bool QueueWorker::run_once() {
    if (queue_.is_processing()) return false;
    if (last_started_ && std::chrono::steady_clock::now() - *last_started_ < cfg_.job_interval) return false;

    auto job = queue_.next();
    if (!job) return false;

    last_started_ = std::chrono::steady_clock::now();
    std::cout << "[worker] Processing: " << job->id << std::endl;
    process(*job);
    return true;
}

void QueueWorker::process(const Job& job) {
    AnalysisRequest req{job.id, job.payload.video_path, job.payload.question_text, job.payload.duration_seconds};

    AnalysisOutcome outcome;
    try {
        outcome = analyzer_.analyze(req);
    } catch (const std::exception& e) {
        outcome = AnalysisOutcome::failure(AnalysisErrorKind::Internal, e.what());
    } catch (...) {
        outcome = AnalysisOutcome::failure(AnalysisErrorKind::Internal, "unknown analyzer error");
    }

    if (outcome.ok()) {
        queue_.mark_success(job.id, *outcome.result);
        return;
    }
    AnalysisError err = outcome.error ? *outcome.error
                                      : AnalysisError{AnalysisErrorKind::Internal, "analyzer returned no result"};
    std::cerr << "[worker] Job " << job.id << " FAILED: " << err.message << std::endl;
    queue_.mark_failed(job.id, err);
}

void QueueWorker::loop() {
    std::cout << "[worker] Worker loop started" << std::endl;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(stop_mtx_);
            if (stop_requested_) break;
        }
        std::chrono::milliseconds pause = cfg_.poll;
        try {
            run_once();
        } catch (const std::exception& e) {
            std::cerr << "[worker] Unexpected error in worker loop: " << e.what() << std::endl;
            pause = cfg_.error_backoff;
        }
        if (!sleep_unless_stopped(pause)) break;
    }
    std::cout << "[worker] Worker loop exited" << std::endl;
}

bool QueueWorker::sleep_unless_stopped(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(stop_mtx_);
    return !stop_cv_.wait_for(lock, d, [this] { return stop_requested_; });
}
