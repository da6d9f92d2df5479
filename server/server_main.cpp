#include "correlation_handler.h"
#include "json_response.h"
#include "common/config.h"
#include "common/logger.hpp"
#include "correlation/correlation_engine.h"
#include "linguistics/model_registry.h"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace refnum_server;

namespace {

crow::response JsonReply(int status, const json& body) {
    crow::response res(status, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

/**
 * @brief Parse the body and dispatch to one handler method
 */
template<typename Handle>
crow::response Dispatch(const crow::request& req, Handle handle) {
    try {
        json request_json = json::parse(req.body);
        auto request = CorrelationRequest::FromJson(request_json);

        json response_json;
        int status_code = handle(request, response_json);
        return JsonReply(status_code, response_json);

    } catch (const json::exception& e) {
        LOG_ERROR("JSON parse error: {}", e.what());
        return JsonReply(400, JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INVALID_PARAMETER, std::string("Invalid JSON format: ") + e.what()));

    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error: {}", e.what());
        return JsonReply(500, JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INTERNAL_ERROR, std::string("Internal server error: ") + e.what()));
    }
}

void PrintUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -p, --port <port>        Server port (default: 8080)\n"
              << "  -t, --threads <num>      Number of threads (default: 4)\n"
              << "  -c, --config <file>      Correlation config JSON\n"
              << "  -m, --lexicon <file>     Language model JSON (overrides config)\n"
              << "  -l, --log-dir <path>     Log directory (default: logs)\n"
              << "  -v, --log-level <level>  trace|debug|info|warn|error (default: info)\n"
              << "  -h, --help               Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    int port = 8080;
    int threads = 4;
    std::string config_path;
    std::string lexicon_path;
    std::string log_dir = "logs";
    std::string log_level = "info";

    static struct option long_options[] = {
        {"port",      required_argument, 0, 'p'},
        {"threads",   required_argument, 0, 't'},
        {"config",    required_argument, 0, 'c'},
        {"lexicon",   required_argument, 0, 'm'},
        {"log-dir",   required_argument, 0, 'l'},
        {"log-level", required_argument, 0, 'v'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    try {
        while ((opt = getopt_long(argc, argv, "p:t:c:m:l:v:h", long_options, &option_index)) != -1) {
            switch (opt) {
                case 'p':
                    port = std::stoi(optarg);
                    break;
                case 't':
                    threads = std::stoi(optarg);
                    break;
                case 'c':
                    config_path = optarg;
                    break;
                case 'm':
                    lexicon_path = optarg;
                    break;
                case 'l':
                    log_dir = optarg;
                    break;
                case 'v':
                    log_level = optarg;
                    break;
                case 'h':
                    PrintUsage(argv[0]);
                    return 0;
                default:
                    std::cerr << "Use -h or --help for usage information\n";
                    return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (port <= 0 || port > 65535 || threads <= 0) {
        std::cerr << "Error: port must be in 1-65535 and threads must be positive\n";
        return 1;
    }

    refnum::LoggerConfig logConfig;
    logConfig.level = log_level;
    logConfig.logToFile = true;
    logConfig.logDir = log_dir;
    logConfig.fileName = "refnum_server.log";
    try {
        refnum::InitLogger(logConfig);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << "\n";
        return 1;
    }

    LOG_INFO("========== RefNum Server Starting ==========");
    LOG_INFO("Log directory: {}", log_dir);

    refnum::CorrelationConfig config;
    config.lexiconPath = std::string(PROJECT_ROOT_DIR) + "/models/en_lexicon.json";
    if (!config_path.empty()) {
        std::string error_msg;
        if (!refnum::LoadConfigFromFile(config_path, config, error_msg)) {
            LOG_ERROR("{}", error_msg);
            return 1;
        }
    }
    if (!lexicon_path.empty()) {
        config.lexiconPath = lexicon_path;
    }
    config.Show();

    auto model = refnum::SharedLanguageModel(config.lexiconPath);
    auto engine = std::make_shared<const refnum::CorrelationEngine>(config, model);
    auto handler = std::make_shared<CorrelationHandler>(engine);

    crow::SimpleApp app;

    CROW_ROUTE(app, "/health")
    ([model]() {
        json response;
        response["status"] = "healthy";
        response["service"] = "RefNum Correlation Server";
        response["version"] = "1.0.0";
        response["languageModel"] = model ? model->name() : "none";
        return JsonReply(200, response);
    });

    CROW_ROUTE(app, "/extract").methods(crow::HTTPMethod::POST)
    ([handler](const crow::request& req) {
        LOG_INFO("Received extract request from {}", req.remote_ip_address);
        return Dispatch(req, [&handler](const CorrelationRequest& request, json& response) {
            return handler->HandleExtract(request, response);
        });
    });

    CROW_ROUTE(app, "/correlate").methods(crow::HTTPMethod::POST)
    ([handler](const crow::request& req) {
        LOG_INFO("Received correlate request from {}", req.remote_ip_address);
        return Dispatch(req, [&handler](const CorrelationRequest& request, json& response) {
            return handler->HandleRequest(request, response);
        });
    });

    LOG_INFO("Starting server on port {} with {} threads...", port, threads);
    LOG_INFO("Endpoints:");
    LOG_INFO("  - POST   /correlate     (Text + detections)");
    LOG_INFO("  - POST   /extract       (Text only)");
    LOG_INFO("  - GET    /health        (Health Check)");
    LOG_INFO("============================================");

    app.port(static_cast<uint16_t>(port))
       .concurrency(static_cast<uint16_t>(threads))
       .run();

    return 0;
}
