#include "analysis_result.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace {
constexpr double kAssumedWordsPerMinute = 140.0;

// Models return scores as numbers or numeric strings. Clamped to 0..100 before
// the conversion so out-of-range values saturate instead of overflowing.
int as_score(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0;
    double v = 0.0;
    if (it->is_number()) v = it->get<double>();
    else if (it->is_string()) v = std::stod(it->get<std::string>());
    else throw std::runtime_error(std::string("field '") + key + "' is not a number");
    if (std::isnan(v)) throw std::runtime_error(std::string("field '") + key + "' is not a number");
    return static_cast<int>(std::clamp(v, 0.0, 100.0));
}

std::string as_string(const json& j, const char* key, const std::string& def) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return def;
    return it->get<std::string>();
}
}

std::string strip_code_fence(const std::string& text) {
    std::string s = trim(text);
    if (s.rfind("```", 0) != 0) return s;
    auto nl = s.find('\n');
    s = nl == std::string::npos ? std::string() : s.substr(nl + 1);
    s = trim(s);
    if (s.size() >= 3 && s.compare(s.size() - 3, 3, "```") == 0) s.erase(s.size() - 3);
    return trim(s);
}

const char* pace_label_for(int wpm) {
    if (wpm < 90) return "slow";
    if (wpm <= 150) return "normal";
    return "fast";
}

AnalysisResult normalize_analysis(const json& model_output, int duration_seconds) {
    if (!model_output.is_object()) throw std::runtime_error("model output is not a JSON object");

    AnalysisResult r;
    r.transcript = trim(as_string(model_output, "transcript", ""));
    r.match_score = as_score(model_output, "match_score");
    r.feedback = as_string(model_output, "feedback", "No feedback.");
    r.emotion = to_lower(as_string(model_output, "emotion", "neutral"));
    r.emotion_score = as_score(model_output, "emotion_score");

    std::size_t words = count_words(r.transcript);
    if (duration_seconds > 0) {
        r.duration_seconds = duration_seconds;
    } else if (words > 0) {
        r.duration_seconds = std::max(1, static_cast<int>(words / kAssumedWordsPerMinute * 60.0));
    } else {
        r.duration_seconds = 1;
    }
    r.pace_wpm = static_cast<int>(static_cast<double>(words) / r.duration_seconds * 60.0);
    r.pace_label = pace_label_for(r.pace_wpm);
    return r;
}

json to_json(const AnalysisResult& r) {
    return json{
        {"transcript", r.transcript},
        {"match_score", r.match_score},
        {"feedback", r.feedback},
        {"emotion", r.emotion},
        {"emotion_score", r.emotion_score},
        {"pace_wpm", r.pace_wpm},
        {"pace_label", r.pace_label},
        {"duration_seconds", r.duration_seconds}
    };
}
