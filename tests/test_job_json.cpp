#include "test_common.h"

#include "analysis_queue.hpp"
#include "job_json.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

void enqueue_request_parsing() {
    json body = {{"token", "T1"}, {"question_index", 2}, {"video_path", "uploads/T1/Q3.webm"},
                 {"question_text", "Why us?"}, {"duration_seconds", 41}};
    EnqueueRequest r = parse_enqueue_request(body);
    expect_eq_str(r.token, "T1", "token");
    expect_eq_ll(r.question_index, 2, "question index");
    expect_eq_str(r.payload.video_path, "uploads/T1/Q3.webm", "video path");
    expect_eq_str(r.payload.question_text, "Why us?", "question text");
    expect_eq_ll(r.payload.duration_seconds, 41, "duration");
    expect_true(!r.manual_retry, "manual retry defaults to false");
    expect_eq_str(r.payload.folder, "", "folder optional");

    bool threw = false;
    try {
        parse_enqueue_request(json{{"token", "T1"}, {"video_path", "x"}});
    } catch (const json::exception&) {
        threw = true;
    }
    expect_true(threw, "missing question_index rejected");

    threw = false;
    try {
        parse_enqueue_request(json{{"token", 7}, {"question_index", 0}, {"video_path", "x"}});
    } catch (const json::exception&) {
        threw = true;
    }
    expect_true(threw, "numeric token rejected");
}

void status_document() {
    TimePoint t0 = Clock::from_time_t(1714558830); // 2024-05-01T10:20:30Z
    AnalysisQueue q(QueueConfig{70s}, [&] { return t0; });
    std::string a = q.add("T1", 0, JobPayload{"uploads/T1", "Q?", "uploads/T1/Q1.webm", 10});
    std::string b = q.add("T1", 1, JobPayload{"uploads/T1", "Q?", "uploads/T1/Q2.webm", 10});

    json jb = status_to_json(*q.status(b));
    expect_eq_str(jb["job_id"].get<std::string>(), "T1:q1", "job id");
    expect_eq_str(jb["status"].get<std::string>(), "pending", "pending status");
    expect_eq_ll(jb["queue_position"].get<long long>(), 1, "second in line");
    expect_eq_str(jb["created_at"].get<std::string>(), "2024-05-01T10:20:30.000Z", "created_at format");
    expect_true(jb["result"].is_null() && jb["started_at"].is_null(), "no result yet");
    expect_true(!jb["finished"].get<bool>(), "pending job not finished");

    q.next();
    q.mark_success(a, "{\"match_score\":90}");
    json ja = status_to_json(*q.status(a));
    expect_eq_str(ja["status"].get<std::string>(), "success", "success status");
    expect_true(ja["queue_position"].is_null(), "finished job has no position");
    expect_true(ja["finished"].get<bool>(), "success is final");
    expect_eq_ll(ja["result"]["match_score"].get<int>(), 90, "result embedded as an object");

    q.next();
    q.mark_failed(b, AnalysisError{AnalysisErrorKind::Quota, "quota"});
    json snap = snapshot_to_json(q.snapshot());
    expect_eq_ll(snap["queue_size"].get<long long>(), 1, "retry counts toward size");
    expect_true(snap["jobs"].empty(), "nothing in line");
    expect_eq_ll(static_cast<long long>(snap["scheduled_retries"].size()), 1, "one scheduled retry");
    expect_eq_str(snap["scheduled_retries"][0]["auto_retry_scheduled_at"].get<std::string>(),
                  "2024-05-01T10:21:40.000Z", "retry 70 seconds later");
    expect_true(!snap["processing"].get<bool>() && snap["current_job"].is_null(), "idle");

    json jfail = job_to_json(q.status(b)->job);
    expect_eq_str(jfail["retry_info"]["last_error"].get<std::string>(), "quota", "last error reported");
    expect_eq_ll(jfail["retry_info"]["auto_retry_attempt"].get<int>(), 1, "attempt reported");
    expect_true(!jfail["finished"].get<bool>(), "job waiting on its retry is not final");
}

} // namespace

int main() {
    enqueue_request_parsing();
    status_document();
    return 0;
}
