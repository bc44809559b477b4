#include "../include/queue_client.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct Reply {
    long status{0};
    std::string body;
};

Reply perform(CurlHandle& c, const std::string& url, std::string& buf) {
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw std::runtime_error(url + ": " + curl_easy_strerror(code));
    }
    Reply r;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &r.status);
    r.body = std::move(buf);
    return r;
}

Reply get(const std::string& url) {
    CurlHandle c;
    std::string buf;
    return perform(c, url, buf);
}

Reply post_json(const std::string& url, const std::string& body_str) {
    CurlHandle c;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body_str.size());
    std::string buf;
    return perform(c, url, buf);
}

std::string error_of(const Reply& r) {
    auto j = json::parse(r.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error")) return j["error"].get<std::string>();
    return "status " + std::to_string(r.status);
}

std::string url_encode(const std::string& s) {
    CurlHandle c;
    char* out = curl_easy_escape(c.h, s.c_str(), (int)s.size());
    if (!out) throw std::runtime_error("curl_easy_escape failed");
    std::string encoded(out);
    curl_free(out);
    return encoded;
}
}

AnalysisQueueClient::AnalysisQueueClient(std::string base_url) : base_(std::move(base_url)) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

std::string AnalysisQueueClient::enqueue(const AnalysisTask& t, bool manual_retry) {
    json body = {
        {"token", t.token},
        {"question_index", t.question_index},
        {"folder", t.folder},
        {"question_text", t.question_text},
        {"video_path", t.video_path},
        {"duration_seconds", t.duration_seconds},
        {"manual_retry", manual_retry}
    };
    Reply r = post_json(base_ + "/enqueue", body.dump());
    if (r.status < 200 || r.status >= 300) throw std::runtime_error("enqueue failed: " + error_of(r));
    return json::parse(r.body).at("id").get<std::string>();
}

std::string AnalysisQueueClient::retry(const AnalysisTask& t) {
    return enqueue(t, true);
}

std::optional<std::string> AnalysisQueueClient::status(const std::string& job_id) {
    Reply r = get(base_ + "/status?id=" + url_encode(job_id));
    if (r.status == 404) return std::nullopt;
    if (r.status < 200 || r.status >= 300) throw std::runtime_error("status failed: " + error_of(r));
    return r.body;
}

std::string AnalysisQueueClient::snapshot() {
    Reply r = get(base_ + "/queue");
    if (r.status < 200 || r.status >= 300) throw std::runtime_error("queue snapshot failed: " + error_of(r));
    return r.body;
}
