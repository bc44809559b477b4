#pragma once
#include <optional>
#include <string>

enum class AnalysisErrorKind {
    Transport,         // could not reach the backend
    Quota,             // backend rejected the request for rate/quota reasons
    Unavailable,       // backend overloaded or failing (5xx)
    MalformedResponse, // backend answered but the model output did not parse
    Internal           // anything else (missing video, unexpected status, ...)
};

const char* analysis_error_kind_name(AnalysisErrorKind k);

struct AnalysisError {
    AnalysisErrorKind kind{AnalysisErrorKind::Internal};
    std::string message;
};

struct AnalysisRequest {
    std::string job_id;
    std::string video_path;
    std::string question_text;
    int duration_seconds{0};
};

// Either a result (raw JSON text) or an error, never both.
struct AnalysisOutcome {
    std::optional<std::string> result;
    std::optional<AnalysisError> error;

    bool ok() const { return result.has_value(); }

    static AnalysisOutcome success(std::string result_json);
    static AnalysisOutcome failure(AnalysisErrorKind kind, std::string message);
};

// The external video-analysis collaborator. analyze() blocks for the
// duration of upload + inference.
class Analyzer {
public:
    virtual ~Analyzer() = default;
    virtual AnalysisOutcome analyze(const AnalysisRequest& req) = 0;
};
