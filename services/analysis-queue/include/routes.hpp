#pragma once
#include "analysis_queue.hpp"
#include <map>
#include <string>

using QueryArgs = std::map<std::string, std::string>;

struct RouteResponse {
    unsigned int status{200};
    std::string body; // JSON
};

// Job id from ?id=... or ?token=...&question_index=...
// Throws std::invalid_argument when neither form is present.
std::string job_id_from_query(const QueryArgs& q);

// Dispatches one request against the queue. Bad input yields 400 with
// {"error": ...}; unknown paths and unknown jobs yield 404.
RouteResponse handle_route(AnalysisQueue& queue, const std::string& method, const std::string& path,
                           const QueryArgs& query, const std::string& body);
