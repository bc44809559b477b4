#include "test_common.h"

#include "analysis_result.hpp"
#include "http_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace {

std::string backend_reply(const std::string& model_text) {
    return json{{"model", "m"}, {"response", model_text}, {"done", true}}.dump();
}

std::string words(int n) {
    std::string s;
    for (int i = 0; i < n; ++i) {
        if (i) s += ' ';
        s += "word";
    }
    return s;
}

void fences() {
    expect_eq_str(strip_code_fence("```json\n{\"a\":1}\n```"), "{\"a\":1}", "json fence stripped");
    expect_eq_str(strip_code_fence("  ```\n{\"a\":1}```  "), "{\"a\":1}", "bare fence stripped");
    expect_eq_str(strip_code_fence("{\"a\":1}"), "{\"a\":1}", "unfenced text kept");
}

void normalization() {
    json raw = {{"transcript", "  I led the migration  "}, {"match_score", 130},
                {"emotion", "Confident"}, {"emotion_score", "-4"}};
    AnalysisResult r = normalize_analysis(raw, 60);
    expect_eq_str(r.transcript, "I led the migration", "transcript trimmed");
    expect_eq_ll(r.match_score, 100, "match score clamped high");
    expect_eq_ll(r.emotion_score, 0, "string score parsed and clamped low");
    expect_eq_str(r.emotion, "confident", "emotion lower-cased");
    expect_eq_str(r.feedback, "No feedback.", "feedback default");
    expect_eq_ll(r.pace_wpm, 4, "four words in a minute");
    expect_eq_str(r.pace_label, "slow", "slow pace");

    AnalysisResult empty = normalize_analysis(json::object(), 0);
    expect_eq_str(empty.emotion, "neutral", "emotion default");
    expect_eq_ll(empty.duration_seconds, 1, "duration floor without speech");
    expect_eq_ll(empty.pace_wpm, 0, "no words, no pace");

    AnalysisResult huge = normalize_analysis(json{{"match_score", 1e10}, {"emotion_score", -1e12}}, 10);
    expect_eq_ll(huge.match_score, 100, "huge match_score saturates at 100");
    expect_eq_ll(huge.emotion_score, 0, "huge negative emotion_score saturates at 0");

    AnalysisResult huge_str = normalize_analysis(json{{"match_score", "99999999999"}, {"emotion_score", "72.9"}}, 10);
    expect_eq_ll(huge_str.match_score, 100, "huge numeric string saturates at 100");
    expect_eq_ll(huge_str.emotion_score, 72, "fractional string truncates");

    AnalysisOutcome big = interpret_backend_response(
        200, json{{"response", "{\"match_score\": 5e20}"}}.dump(), 10);
    expect_true(big.ok(), "out-of-range score is not a malformed response");
    expect_eq_ll(json::parse(*big.result)["match_score"].get<int>(), 100, "score reported as 100");

    bool threw = false;
    try {
        normalize_analysis(json::array(), 10);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "non-object output rejected");
}

void pace() {
    expect_eq_str(pace_label_for(89), "slow", "below 90 is slow");
    expect_eq_str(pace_label_for(90), "normal", "90 is normal");
    expect_eq_str(pace_label_for(150), "normal", "150 is normal");
    expect_eq_str(pace_label_for(151), "fast", "above 150 is fast");

    AnalysisResult r = normalize_analysis(json{{"transcript", words(60)}}, 20);
    expect_eq_ll(r.pace_wpm, 180, "60 words in 20 seconds");
    expect_eq_str(r.pace_label, "fast", "fast pace");

    AnalysisResult est = normalize_analysis(json{{"transcript", words(140)}}, 0);
    expect_eq_ll(est.duration_seconds, 60, "duration estimated from transcript");
    expect_eq_str(est.pace_label, "normal", "estimated pace is normal");
}

void backend_statuses() {
    AnalysisOutcome quota = interpret_backend_response(429, "{}", 10);
    expect_true(!quota.ok() && quota.error->kind == AnalysisErrorKind::Quota, "429 is a quota error");

    AnalysisOutcome down = interpret_backend_response(503, "overloaded", 10);
    expect_true(!down.ok() && down.error->kind == AnalysisErrorKind::Unavailable, "503 is unavailable");

    AnalysisOutcome bad = interpret_backend_response(400, "{}", 10);
    expect_true(!bad.ok() && bad.error->kind == AnalysisErrorKind::Internal, "400 is internal");

    AnalysisOutcome garbled = interpret_backend_response(200, backend_reply("I cannot help with that"), 10);
    expect_true(!garbled.ok() && garbled.error->kind == AnalysisErrorKind::MalformedResponse,
                "non-JSON model text is malformed");

    AnalysisOutcome empty = interpret_backend_response(200, backend_reply(""), 10);
    expect_true(!empty.ok() && empty.error->kind == AnalysisErrorKind::MalformedResponse, "empty response is malformed");

    AnalysisOutcome not_json = interpret_backend_response(200, "<html>", 10);
    expect_true(!not_json.ok() && not_json.error->kind == AnalysisErrorKind::MalformedResponse,
                "non-JSON body is malformed");
}

void backend_success() {
    std::string model = "```json\n{\"transcript\":\"we shipped it on time\",\"match_score\":81,"
                        "\"feedback\":\"Clear.\",\"emotion\":\"calm\",\"emotion_score\":70}\n```";
    AnalysisOutcome o = interpret_backend_response(200, backend_reply(model), 5);
    expect_true(o.ok() && !o.error, "success carries a result only");
    json r = json::parse(*o.result);
    expect_eq_str(r["transcript"].get<std::string>(), "we shipped it on time", "transcript kept");
    expect_eq_ll(r["match_score"].get<int>(), 81, "score kept");
    expect_eq_ll(r["duration_seconds"].get<int>(), 5, "duration from the request");
    expect_eq_ll(r["pace_wpm"].get<int>(), 60, "five words in five seconds");
    expect_eq_str(r["pace_label"].get<std::string>(), "slow", "pace label");
}

void prompt() {
    std::string p = build_analysis_prompt("Describe a hard bug you fixed.");
    expect_true(p.find("Describe a hard bug you fixed.") != std::string::npos, "prompt names the question");
    expect_true(p.find("match_score") != std::string::npos, "prompt asks for the score");
}

} // namespace

int main() {
    fences();
    normalization();
    pace();
    backend_statuses();
    backend_success();
    prompt();
    return 0;
}
