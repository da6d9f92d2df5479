#include "common/config.h"
#include "common/logger.hpp"
#include "correlation/correlation_engine.h"
#include "correlation/detection_io.h"
#include "correlation/label_map_io.h"
#include "linguistics/model_registry.h"
#include <getopt.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

void PrintUsage(const char* prog) {
    std::cout << "Usage: " << prog << " --text <file> [options]\n"
              << "Options:\n"
              << "  -i, --text <file>        Patent text (required)\n"
              << "  -d, --detections <file>  OCR detections JSON\n"
              << "  -c, --config <file>      Correlation config JSON\n"
              << "  -m, --lexicon <file>     Language model JSON (overrides config)\n"
              << "  -o, --output <file>      Save the mapping to a file\n"
              << "  -f, --format <fmt>       json | kv (default: json)\n"
              << "  -P, --policy <name>      shortest | most_frequent (overrides config)\n"
              << "  -s, --stats              Log timings and counters\n"
              << "  -v, --log-level <level>  trace|debug|info|warn|error (default: warn)\n"
              << "  -h, --help               Show this help message\n";
}

bool ReadFile(const std::string& path, std::string& content) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    content = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string text_path;
    std::string detections_path;
    std::string config_path;
    std::string lexicon_path;
    std::string output_path;
    std::string format = "json";
    std::string policy;
    std::string log_level = "warn";
    bool show_stats = false;

    static struct option long_options[] = {
        {"text",       required_argument, 0, 'i'},
        {"detections", required_argument, 0, 'd'},
        {"config",     required_argument, 0, 'c'},
        {"lexicon",    required_argument, 0, 'm'},
        {"output",     required_argument, 0, 'o'},
        {"format",     required_argument, 0, 'f'},
        {"policy",     required_argument, 0, 'P'},
        {"stats",      no_argument,       0, 's'},
        {"log-level",  required_argument, 0, 'v'},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "i:d:c:m:o:f:P:sv:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'i': text_path = optarg; break;
            case 'd': detections_path = optarg; break;
            case 'c': config_path = optarg; break;
            case 'm': lexicon_path = optarg; break;
            case 'o': output_path = optarg; break;
            case 'f': format = optarg; break;
            case 'P': policy = optarg; break;
            case 's': show_stats = true; break;
            case 'v': log_level = optarg; break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                std::cerr << "Use -h or --help for usage information\n";
                return 1;
        }
    }

    if (text_path.empty()) {
        std::cerr << "Error: --text is required\n";
        PrintUsage(argv[0]);
        return 1;
    }
    if (format != "json" && format != "kv") {
        std::cerr << "Error: format must be 'json' or 'kv'\n";
        return 1;
    }

    refnum::LoggerConfig logConfig;
    logConfig.level = show_stats && log_level == "warn" ? "info" : log_level;
    try {
        refnum::InitLogger(logConfig);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << "\n";
        return 1;
    }

    refnum::CorrelationConfig config;
    config.lexiconPath = std::string(PROJECT_ROOT_DIR) + "/models/en_lexicon.json";
    std::string error_msg;
    if (!config_path.empty() && !refnum::LoadConfigFromFile(config_path, config, error_msg)) {
        LOG_ERROR("{}", error_msg);
        return 1;
    }
    if (!lexicon_path.empty()) {
        config.lexiconPath = lexicon_path;
    }
    if (!policy.empty() && !refnum::ParseLabelPolicy(policy, config.labelPolicy)) {
        LOG_ERROR("Unknown label policy '{}'", policy);
        return 1;
    }
    LOG_DEBUG_EXEC([&]() { config.Show(); });

    std::string text;
    if (!ReadFile(text_path, text)) {
        LOG_ERROR("Cannot read text file: {}", text_path);
        return 1;
    }

    std::vector<refnum::Detection> detections;
    if (!detections_path.empty() &&
        !refnum::DetectionIO::LoadFromJSON(detections_path, detections, error_msg)) {
        LOG_ERROR("{}", error_msg);
        return 1;
    }

    refnum::CorrelationEngine engine(config, refnum::SharedLanguageModel(config.lexiconPath));

    refnum::CorrelationStats stats;
    refnum::NumeralLabelMap labels = engine.correlate(text, detections, &stats);
    if (show_stats) {
        stats.Show();
    }

    if (format == "kv") {
        std::cout << refnum::LabelMapIO::ToKeyValueText(labels);
    } else {
        std::cout << refnum::LabelMapIO::ToJson(labels).dump(2) << std::endl;
    }

    if (!output_path.empty()) {
        bool saved = format == "kv" ? refnum::LabelMapIO::SaveToKeyValue(labels, output_path)
                                    : refnum::LabelMapIO::SaveToJSON(labels, output_path);
        if (!saved) {
            return 1;
        }
    }

    return 0;
}
