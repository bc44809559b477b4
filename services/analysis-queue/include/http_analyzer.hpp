#pragma once
#include "analyzer.hpp"
#include "config.hpp"
#include <string>

// Prompt sent to the model for one recorded answer.
std::string build_analysis_prompt(const std::string& question_text);

// Maps an HTTP reply from the analysis backend to an outcome. Pure; split out
// of HttpAnalyzer so status and body handling can be exercised without a server.
AnalysisOutcome interpret_backend_response(long status, const std::string& body, int duration_seconds);

// Analyzer backed by a generate-style HTTP endpoint (<url>/api/generate).
class HttpAnalyzer : public Analyzer {
public:
    explicit HttpAnalyzer(AnalyzerConfig cfg);
    AnalysisOutcome analyze(const AnalysisRequest& req) override;

private:
    AnalyzerConfig cfg_;
};
