#pragma once
#include <optional>
#include <string>

struct AnalysisTask {
    std::string token;
    int question_index{0};
    std::string folder;
    std::string question_text;
    std::string video_path;
    int duration_seconds{0};
};

// Client for the analysis-queue HTTP surface. Replies are returned as raw JSON
// text; transport failures throw std::runtime_error.
class AnalysisQueueClient {
public:
    explicit AnalysisQueueClient(std::string base_url);
    // Returns the job id.
    std::string enqueue(const AnalysisTask& t, bool manual_retry = false);
    std::string retry(const AnalysisTask& t);
    // Empty when the queue does not know the job.
    std::optional<std::string> status(const std::string& job_id);
    std::string snapshot();

private:
    std::string base_;
};
