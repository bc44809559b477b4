#pragma once
#include "job.hpp"
#include <string>

// POSTs the job JSON to a caller-owned endpoint after each recorded outcome so
// the caller can persist it. Delivery failures are logged only.
class CallbackNotifier {
public:
    explicit CallbackNotifier(std::string url, long timeout_ms = 10000);
    void operator()(const Job& job) const;

private:
    std::string url_;
    long timeout_ms_;
};
