#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/queue_sdk/include/queue_client.hpp"

using json = nlohmann::json;

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static void usage() {
    std::cerr << "analysis-ctl usage:\n"
              << "  enqueue --token T --question N --video PATH [--folder F] [--question-text Q] [--duration S]\n"
              << "  retry   --token T --question N --video PATH [--folder F] [--question-text Q] [--duration S]\n"
              << "  status  --id ID | --token T --question N\n"
              << "  queue\n"
              << "  [--url URL]  (default $ANALYSIS_QUEUE_URL or http://localhost:7100)\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    std::string url = getenv_or("ANALYSIS_QUEUE_URL", "http://localhost:7100");
    AnalysisTask task;
    std::string id;
    bool have_question = false;
    try {
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--url" && i + 1 < argc) url = argv[++i];
            else if (a == "--id" && i + 1 < argc) id = argv[++i];
            else if (a == "--token" && i + 1 < argc) task.token = argv[++i];
            else if (a == "--question" && i + 1 < argc) { task.question_index = std::stoi(argv[++i]); have_question = true; }
            else if (a == "--video" && i + 1 < argc) task.video_path = argv[++i];
            else if (a == "--folder" && i + 1 < argc) task.folder = argv[++i];
            else if (a == "--question-text" && i + 1 < argc) task.question_text = argv[++i];
            else if (a == "--duration" && i + 1 < argc) task.duration_seconds = std::stoi(argv[++i]);
            else { usage(); return 2; }
        }

        AnalysisQueueClient client(url);
        if (cmd == "enqueue" || cmd == "retry") {
            if (task.token.empty() || !have_question || task.video_path.empty()) { usage(); return 2; }
            std::string job_id = cmd == "retry" ? client.retry(task) : client.enqueue(task);
            std::cout << job_id << "\n";
            return 0;
        } else if (cmd == "status") {
            if (id.empty()) {
                if (task.token.empty() || !have_question) { usage(); return 2; }
                id = task.token + ":q" + std::to_string(task.question_index);
            }
            auto st = client.status(id);
            if (!st) {
                std::cerr << "[analysis-ctl] " << id << ": not found\n";
                return 3;
            }
            std::cout << json::parse(*st).dump(2) << "\n";
            return 0;
        } else if (cmd == "queue") {
            std::cout << json::parse(client.snapshot()).dump(2) << "\n";
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
