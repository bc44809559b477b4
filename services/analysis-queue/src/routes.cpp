#include "routes.hpp"
#include "job_json.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {
RouteResponse error_response(unsigned int status, const std::string& msg) {
    return RouteResponse{status, json({{"error", msg}}).dump()};
}
}

std::string job_id_from_query(const QueryArgs& q) {
    auto id = q.find("id");
    if (id != q.end() && !id->second.empty()) return id->second;
    auto token = q.find("token");
    auto index = q.find("question_index");
    if (token == q.end() || token->second.empty() || index == q.end()) {
        throw std::invalid_argument("id or token and question_index query parameters required");
    }
    return make_job_id(token->second, std::stoi(index->second));
}

RouteResponse handle_route(AnalysisQueue& queue, const std::string& method, const std::string& path,
                           const QueryArgs& query, const std::string& body) {
    try {
        if (method == "POST" && (path == "/enqueue" || path == "/retry")) {
            EnqueueRequest req = parse_enqueue_request(json::parse(body));
            if (path == "/retry") req.manual_retry = true;
            std::string id = queue.add(req.token, req.question_index, req.payload, req.manual_retry);
            auto st = queue.status(id);
            json out = {{"id", id}, {"status", st ? job_status_name(st->job.status) : "pending"}};
            return RouteResponse{200, out.dump()};
        }
        if (method == "GET" && path == "/status") {
            auto st = queue.status(job_id_from_query(query));
            if (!st) return error_response(404, "job not found");
            return RouteResponse{200, status_to_json(*st).dump()};
        }
        if (method == "GET" && path == "/queue") {
            return RouteResponse{200, snapshot_to_json(queue.snapshot()).dump()};
        }
        return error_response(404, "not found");
    } catch (const std::exception& e) {
        return error_response(400, e.what());
    }
}
