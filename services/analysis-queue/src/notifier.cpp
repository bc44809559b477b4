#include "notifier.hpp"
#include "http.hpp"
#include "job_json.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

CallbackNotifier::CallbackNotifier(std::string url, long timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {}

void CallbackNotifier::operator()(const Job& job) const {
    try {
        auto r = http_post_json(url_, job_to_json(job).dump(), timeout_ms_);
        if (r.status < 200 || r.status >= 300) {
            std::cerr << "[notify] " << job.id << " -> " << url_ << " returned status " << r.status << std::endl;
            return;
        }
        std::cout << "[notify] " << job.id << " (" << job_status_name(job.status) << ") delivered" << std::endl;
    } catch (const std::runtime_error& e) {
        std::cerr << "[notify] " << job.id << " -> " << url_ << " failed: " << e.what() << std::endl;
    }
}
