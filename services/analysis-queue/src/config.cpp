#include "config.hpp"
#include "util.hpp"

ServiceConfig load_config_from_env() {
    ServiceConfig cfg;
    cfg.port = static_cast<int>(getenv_long_or("ANALYSIS_QUEUE_PORT", cfg.port));

    cfg.queue.auto_retry_delay = std::chrono::seconds(
        getenv_long_or("ANALYSIS_AUTO_RETRY_DELAY_SEC",
                       std::chrono::duration_cast<std::chrono::seconds>(cfg.queue.auto_retry_delay).count()));

    cfg.worker.job_interval = std::chrono::seconds(
        getenv_long_or("ANALYSIS_JOB_INTERVAL_SEC",
                       std::chrono::duration_cast<std::chrono::seconds>(cfg.worker.job_interval).count()));
    cfg.worker.poll = std::chrono::milliseconds(getenv_long_or("ANALYSIS_POLL_MS", cfg.worker.poll.count()));
    cfg.worker.error_backoff =
        std::chrono::milliseconds(getenv_long_or("ANALYSIS_ERROR_BACKOFF_MS", cfg.worker.error_backoff.count()));

    cfg.analyzer.url = getenv_or("ANALYZER_URL", cfg.analyzer.url);
    if (!cfg.analyzer.url.empty() && cfg.analyzer.url.back() == '/') cfg.analyzer.url.pop_back();
    cfg.analyzer.model = getenv_or("ANALYZER_MODEL", cfg.analyzer.model);
    cfg.analyzer.timeout_ms = getenv_long_or("ANALYZER_TIMEOUT_MS", cfg.analyzer.timeout_ms);

    cfg.callback_url = getenv_or("ANALYSIS_CALLBACK_URL", "");
    return cfg;
}
