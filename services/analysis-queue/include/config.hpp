#pragma once
#include "analysis_queue.hpp"
#include "queue_worker.hpp"
#include <string>

struct AnalyzerConfig {
    std::string url{"http://localhost:11434"};
    std::string model{"gemini-2.5-flash"};
    long timeout_ms{240000};
};

struct ServiceConfig {
    int port{7100};
    QueueConfig queue;
    WorkerConfig worker;
    AnalyzerConfig analyzer;
    std::string callback_url; // empty disables completion notifications
};

// Defaults overridden by ANALYSIS_* / ANALYZER_* environment variables.
ServiceConfig load_config_from_env();
