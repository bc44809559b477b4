#include "analyzer.hpp"
#include <utility>

const char* analysis_error_kind_name(AnalysisErrorKind k) {
    switch (k) {
        case AnalysisErrorKind::Transport: return "transport";
        case AnalysisErrorKind::Quota: return "quota";
        case AnalysisErrorKind::Unavailable: return "unavailable";
        case AnalysisErrorKind::MalformedResponse: return "malformed_response";
        case AnalysisErrorKind::Internal: return "internal";
    }
    return "internal";
}

AnalysisOutcome AnalysisOutcome::success(std::string result_json) {
    AnalysisOutcome o;
    o.result = std::move(result_json);
    return o;
}

AnalysisOutcome AnalysisOutcome::failure(AnalysisErrorKind kind, std::string message) {
    AnalysisOutcome o;
    o.error = AnalysisError{kind, std::move(message)};
    return o;
}
