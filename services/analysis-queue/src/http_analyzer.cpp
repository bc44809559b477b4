#include "http_analyzer.hpp"
#include "analysis_result.hpp"
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

std::string build_analysis_prompt(const std::string& question_text) {
    return
        "You transcribe and assess one recorded interview answer.\n"
        "1. Transcribe only the words actually spoken, dropping filler words. "
        "Never invent or complete sentences. If there is no clear speech, return "
        "{\"transcript\": \"\", \"match_score\": 0, \"feedback\": \"No audible speech.\", "
        "\"emotion\": \"silent\", \"emotion_score\": 0}.\n"
        "2. match_score (0-100): how well the answer addresses: \"" + question_text + "\". "
        "Score strictly: 90+ exceptional and specific, 75-89 correct but shallow, below 75 off-topic or incomplete.\n"
        "3. feedback: 2-3 sentences for the hiring manager on depth, clarity and completeness.\n"
        "4. emotion: one of neutral, happy, stressed, confident, nervous, angry, calm, thoughtful, rushed, uncertain; "
        "emotion_score (0-100).\n"
        "Reply with JSON only: {\"transcript\": \"...\", \"match_score\": 0, \"feedback\": \"...\", "
        "\"emotion\": \"...\", \"emotion_score\": 0}";
}

AnalysisOutcome interpret_backend_response(long status, const std::string& body, int duration_seconds) {
    if (status == 429) {
        return AnalysisOutcome::failure(AnalysisErrorKind::Quota, "analysis backend quota exhausted (status 429)");
    }
    if (status >= 500) {
        return AnalysisOutcome::failure(AnalysisErrorKind::Unavailable,
                                        "analysis backend unavailable: status " + std::to_string(status));
    }
    if (status < 200 || status >= 300) {
        return AnalysisOutcome::failure(AnalysisErrorKind::Internal,
                                        "analysis failed: status " + std::to_string(status));
    }

    try {
        auto reply = json::parse(body);
        std::string text = reply.value("response", std::string());
        if (text.empty()) {
            return AnalysisOutcome::failure(AnalysisErrorKind::MalformedResponse, "empty model response");
        }
        auto model_output = json::parse(strip_code_fence(text));
        AnalysisResult r = normalize_analysis(model_output, duration_seconds);
        return AnalysisOutcome::success(to_json(r).dump());
    } catch (const std::exception& e) {
        return AnalysisOutcome::failure(AnalysisErrorKind::MalformedResponse,
                                        std::string("could not parse model response: ") + e.what());
    }
}

HttpAnalyzer::HttpAnalyzer(AnalyzerConfig cfg) : cfg_(std::move(cfg)) {}

AnalysisOutcome HttpAnalyzer::analyze(const AnalysisRequest& req) {
    std::error_code ec;
    if (!std::filesystem::exists(req.video_path, ec)) {
        return AnalysisOutcome::failure(AnalysisErrorKind::Internal, "video file not found: " + req.video_path);
    }

    std::cout << "[analyzer] Analyzing " << std::filesystem::path(req.video_path).filename().string()
              << " for " << req.job_id << std::endl;
    json body = {
        {"model", cfg_.model},
        {"prompt", build_analysis_prompt(req.question_text)},
        {"video_path", req.video_path},
        {"stream", false}
    };

    HttpResponse r;
    try {
        r = http_post_json(cfg_.url + "/api/generate", body.dump(), cfg_.timeout_ms);
    } catch (const std::runtime_error& e) {
        return AnalysisOutcome::failure(AnalysisErrorKind::Transport, e.what());
    }

    AnalysisOutcome outcome = interpret_backend_response(r.status, r.body, req.duration_seconds);
    if (outcome.ok()) {
        std::cout << "[analyzer] Done " << req.job_id << std::endl;
    } else {
        std::cerr << "[analyzer] " << req.job_id << ": " << outcome.error->message << std::endl;
    }
    return outcome;
}
