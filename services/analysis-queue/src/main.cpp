#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <curl/curl.h>
#include <microhttpd.h>
#include "analysis_queue.hpp"
#include "config.hpp"
#include "http_analyzer.hpp"
#include "notifier.hpp"
#include "queue_worker.hpp"
#include "routes.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static QueryArgs parse_query(struct MHD_Connection* conn) {
    QueryArgs out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<QueryArgs*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* queue = static_cast<AnalysisQueue*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    QueryArgs query = ci->method == "GET" ? parse_query(connection) : QueryArgs{};
    RouteResponse r = handle_route(*queue, ci->method, ci->url, query, ci->body);
    return send_response(connection, r.status, r.body);
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "analysis-queue usage:\n"
              << "  analysis-queue [--port N] [--poll-ms N] [--interval-sec N] [--retry-delay-sec N]\n"
              << "environment: ANALYSIS_QUEUE_PORT ANALYSIS_JOB_INTERVAL_SEC ANALYSIS_AUTO_RETRY_DELAY_SEC\n"
              << "             ANALYSIS_POLL_MS ANALYSIS_ERROR_BACKOFF_MS ANALYZER_URL ANALYZER_MODEL\n"
              << "             ANALYZER_TIMEOUT_MS ANALYSIS_CALLBACK_URL\n";
}

int main(int argc, char** argv) {
    ServiceConfig cfg = load_config_from_env();
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc) cfg.port = std::stoi(argv[++i]);
            else if (a == "--poll-ms" && i + 1 < argc) cfg.worker.poll = std::chrono::milliseconds(std::stol(argv[++i]));
            else if (a == "--interval-sec" && i + 1 < argc) cfg.worker.job_interval = std::chrono::seconds(std::stol(argv[++i]));
            else if (a == "--retry-delay-sec" && i + 1 < argc) cfg.queue.auto_retry_delay = std::chrono::seconds(std::stol(argv[++i]));
            else { usage(); return a == "--help" ? 0 : 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[server] Bad argument: " << e.what() << "\n";
        usage();
        return 2;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    AnalysisQueue queue(cfg.queue);
    if (!cfg.callback_url.empty()) {
        queue.set_completion_listener(CallbackNotifier(cfg.callback_url));
        std::cout << "[server] Completion notifications -> " << cfg.callback_url << std::endl;
    }
    HttpAnalyzer analyzer(cfg.analyzer);
    QueueWorker worker(queue, analyzer, cfg.worker);

    std::cout << "[server] Starting HTTP server on port " << cfg.port << " (analyzer " << cfg.analyzer.url
              << ", model " << cfg.analyzer.model << ")..." << std::endl;
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, cfg.port, nullptr, nullptr,
                                            &handler, &queue,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[server] Failed to start HTTP server" << std::endl;
        curl_global_cleanup();
        return 1;
    }
    worker.start();

    std::signal(SIGINT, [](int) { g_stop = 1; });
    std::signal(SIGTERM, [](int) { g_stop = 1; });
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "[server] Shutting down" << std::endl;
    MHD_stop_daemon(d);
    worker.stop();
    curl_global_cleanup();
    return 0;
}
