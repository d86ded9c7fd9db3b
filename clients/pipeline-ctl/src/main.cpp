#include "../../../shared/cpp/pipeline_sdk/include/pipeline_client.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using json = nlohmann::json;

static std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

static void usage() {
    std::cerr << "pipeline-ctl usage:\n"
              << "  add --title <t> --url <source> --quality <q> --backend <id> --dest <path>\n"
              << "      [--type movie|series|novela] [--season N] [--episode N] [--year N]\n"
              << "      [--priority low|medium|high] [--max-attempts N]\n"
              << "  status <job-id>\n"
              << "  pause|resume|cancel|retry <job-id>\n"
              << "  stats\n"
              << "  health <backend-id>\n"
              << "options: --server <url> (default $PIPELINE_URL or http://localhost:7100)\n";
}

static int print_result(const ClientResult& r) {
    if (!r.ok) {
        std::cerr << "[ERROR] " << r.error << "\n";
        return r.status == 0 ? 3 : 1;
    }
    std::cout << r.body.dump(2) << "\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string server = getenv_or("PIPELINE_URL", "http://localhost:7100");
    std::string cmd = argv[1];
    try {
        if (cmd == "add") {
            json d = {{"content_type", "movie"}, {"priority", "medium"}};
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--server" && i + 1 < argc) server = argv[++i];
                else if (a == "--title" && i + 1 < argc) d["title"] = argv[++i];
                else if (a == "--url" && i + 1 < argc) d["source_url"] = argv[++i];
                else if (a == "--quality" && i + 1 < argc) d["quality"] = argv[++i];
                else if (a == "--backend" && i + 1 < argc) d["backend_id"] = argv[++i];
                else if (a == "--dest" && i + 1 < argc) d["destination_path"] = argv[++i];
                else if (a == "--type" && i + 1 < argc) d["content_type"] = argv[++i];
                else if (a == "--season" && i + 1 < argc) d["season"] = std::stoi(argv[++i]);
                else if (a == "--episode" && i + 1 < argc) d["episode"] = std::stoi(argv[++i]);
                else if (a == "--year" && i + 1 < argc) d["year"] = std::stoi(argv[++i]);
                else if (a == "--priority" && i + 1 < argc) d["priority"] = argv[++i];
                else if (a == "--max-attempts" && i + 1 < argc) d["max_attempts"] = std::stoi(argv[++i]);
                else { usage(); return 2; }
            }
            PipelineClient client(server);
            return print_result(client.create_job(d));
        }

        std::string arg;
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--server" && i + 1 < argc) server = argv[++i];
            else if (arg.empty()) arg = a;
            else { usage(); return 2; }
        }
        PipelineClient client(server);
        if (cmd == "stats") return print_result(client.stats());
        if (arg.empty()) { usage(); return 2; }
        if (cmd == "status") return print_result(client.job_status(arg));
        if (cmd == "health") return print_result(client.backend_health(arg));
        if (cmd == "pause" || cmd == "resume" || cmd == "cancel" || cmd == "retry") {
            return print_result(client.control(arg, cmd));
        }
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
