#pragma once
#include "analysis_queue.hpp"
#include "analyzer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

struct WorkerConfig {
    std::chrono::milliseconds poll{1000};                            // loop tick
    std::chrono::milliseconds job_interval{std::chrono::seconds(15)}; // between job starts
    std::chrono::milliseconds error_backoff{5000};
};

// Single background consumer of an AnalysisQueue. At most one analysis runs
// at a time and consecutive starts are at least job_interval apart.
class QueueWorker {
public:
    QueueWorker(AnalysisQueue& queue, Analyzer& analyzer, WorkerConfig cfg = {});
    ~QueueWorker();

    QueueWorker(const QueueWorker&) = delete;
    QueueWorker& operator=(const QueueWorker&) = delete;

    void start();
    // Returns once the loop has exited. An analysis in flight is allowed to
    // finish and its outcome is still reported.
    void stop();
    bool running() const { return running_.load(); }

    // One gated iteration on the calling thread. Returns true when a job was
    // taken and its outcome reported.
    bool run_once();

private:
    void loop();
    void process(const Job& job);
    bool sleep_unless_stopped(std::chrono::milliseconds d);

    AnalysisQueue& queue_;
    Analyzer& analyzer_;
    WorkerConfig cfg_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex stop_mtx_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};

    std::optional<std::chrono::steady_clock::time_point> last_started_;
};
