#pragma once
#include <nlohmann/json.hpp>
#include <string>

struct AnalysisResult {
    std::string transcript;
    int match_score{0};   // 0..100
    std::string feedback;
    std::string emotion;
    int emotion_score{0}; // 0..100
    int pace_wpm{0};
    std::string pace_label; // slow | normal | fast
    int duration_seconds{0};
};

// Strips a surrounding ```json ... ``` fence from model output.
std::string strip_code_fence(const std::string& text);

const char* pace_label_for(int wpm);

// Builds a result from the model's JSON object: clamps scores, fills defaults
// and computes pace from the transcript and the recording duration.
AnalysisResult normalize_analysis(const nlohmann::json& model_output, int duration_seconds);

nlohmann::json to_json(const AnalysisResult& r);
