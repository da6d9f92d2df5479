#include "common/config.h"
#include "common/logger.hpp"
#include "correlation/correlation_engine.h"
#include "correlation/detection_io.h"
#include "correlation/label_map_io.h"
#include "linguistics/model_registry.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/**
 * @brief <stem>.txt documents of a corpus directory, with <stem>.json detections when present
 */
std::vector<refnum::CorrelationInput> LoadCorpus(const std::string& corpusDir,
                                                 std::vector<std::string>& names) {
    std::vector<std::string> textFiles;
    for (const auto& entry : fs::directory_iterator(corpusDir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            textFiles.push_back(entry.path().string());
        }
    }
    std::sort(textFiles.begin(), textFiles.end());

    std::vector<refnum::CorrelationInput> inputs;
    for (const auto& textPath : textFiles) {
        std::ifstream ifs(textPath);
        if (!ifs.is_open()) {
            LOG_WARN("Cannot read {}", textPath);
            continue;
        }
        std::stringstream buffer;
        buffer << ifs.rdbuf();

        refnum::CorrelationInput input;
        input.text = buffer.str();

        fs::path detectionsPath = fs::path(textPath).replace_extension(".json");
        if (fs::exists(detectionsPath)) {
            std::string error_msg;
            if (!refnum::DetectionIO::LoadFromJSON(detectionsPath.string(), input.detections, error_msg)) {
                LOG_WARN("Ignoring detections of {}: {}", textPath, error_msg);
                input.detections.clear();
            }
        }

        names.push_back(fs::path(textPath).stem().string());
        inputs.push_back(std::move(input));
    }
    return inputs;
}

} // namespace

int main(int argc, char** argv) {
    // benchmark [runs] [corpus_dir] [threads]
    int runsPerDocument = 20;
    if (argc > 1) {
        runsPerDocument = std::atoi(argv[1]);
        if (runsPerDocument < 1) runsPerDocument = 20;
    }

    std::string projectRoot = PROJECT_ROOT_DIR;
    std::string corpusDir = argc > 2 ? argv[2] : projectRoot + "/test/test_data";
    std::string outputDir = projectRoot + "/benchmark/results";

    size_t threads = std::thread::hardware_concurrency();
    if (argc > 3) {
        int requested = std::atoi(argv[3]);
        if (requested > 0) threads = static_cast<size_t>(requested);
    }
    if (threads == 0) threads = 4;

    LOG_INFO("========================================");
    LOG_INFO("RefNum - Correlation Benchmark");
    LOG_INFO("========================================");
    LOG_INFO("Corpus: {}", corpusDir);
    LOG_INFO("Output: {}", outputDir);
    LOG_INFO("Runs per document: {}", runsPerDocument);
    LOG_INFO("Threads: {}", threads);

    if (!fs::is_directory(corpusDir)) {
        LOG_ERROR("Corpus directory does not exist: {}", corpusDir);
        return -1;
    }
    fs::create_directories(outputDir);

    refnum::CorrelationConfig config;
    config.lexiconPath = projectRoot + "/models/en_lexicon.json";
    auto model = refnum::SharedLanguageModel(config.lexiconPath);
    if (!model) {
        LOG_ERROR("Benchmark needs the language model: {}", config.lexiconPath);
        return -1;
    }
    refnum::CorrelationEngine engine(config, model);

    std::vector<std::string> names;
    std::vector<refnum::CorrelationInput> documents = LoadCorpus(corpusDir, names);
    if (documents.empty()) {
        LOG_ERROR("No .txt documents found in {}", corpusDir);
        return -1;
    }

    size_t totalBytes = 0;
    for (const auto& doc : documents) {
        totalBytes += doc.text.size();
    }
    LOG_INFO("Loaded {} documents ({} bytes)", documents.size(), totalBytes);

    // Sequential: per-stage timings of one pass
    std::vector<refnum::CorrelationStats> stats(documents.size());
    std::vector<refnum::NumeralLabelMap> labels(documents.size());
    auto startSeq = std::chrono::high_resolution_clock::now();
    for (int run = 0; run < runsPerDocument; ++run) {
        for (size_t i = 0; i < documents.size(); ++i) {
            labels[i] = engine.correlate(documents[i].text, documents[i].detections, &stats[i]);
        }
    }
    auto endSeq = std::chrono::high_resolution_clock::now();

    // Batch: the same work spread over the thread pool
    std::vector<refnum::CorrelationInput> batch;
    batch.reserve(documents.size() * runsPerDocument);
    for (int run = 0; run < runsPerDocument; ++run) {
        batch.insert(batch.end(), documents.begin(), documents.end());
    }
    auto startBatch = std::chrono::high_resolution_clock::now();
    std::vector<refnum::NumeralLabelMap> batchLabels = engine.correlateBatch(batch, threads);
    auto endBatch = std::chrono::high_resolution_clock::now();

    int totalTasks = static_cast<int>(batch.size());
    double seqTimeMs = std::chrono::duration<double, std::milli>(endSeq - startSeq).count();
    double batchTimeMs = std::chrono::duration<double, std::milli>(endBatch - startBatch).count();
    double mbPerRun = static_cast<double>(totalBytes) / (1024.0 * 1024.0);

    LOG_INFO("========== Benchmark Results ==========");
    LOG_INFO("Total Tasks: {} (Documents: {}, Repeats: {})", totalTasks, documents.size(), runsPerDocument);
    LOG_INFO("Sequential: {:.2f} ms total, {:.3f} ms/document, {:.2f} MB/s",
             seqTimeMs, seqTimeMs / totalTasks, mbPerRun * runsPerDocument / (seqTimeMs / 1000.0));
    LOG_INFO("Batch:      {:.2f} ms total, {:.3f} ms/document, {:.2f} MB/s (x{:.2f})",
             batchTimeMs, batchTimeMs / totalTasks, mbPerRun * runsPerDocument / (batchTimeMs / 1000.0),
             batchTimeMs > 0 ? seqTimeMs / batchTimeMs : 0.0);
    LOG_INFO("========================================");

    int mismatches = 0;
    for (size_t i = 0; i < batchLabels.size(); ++i) {
        if (batchLabels[i] != labels[i % documents.size()]) {
            mismatches++;
        }
    }
    if (mismatches > 0) {
        LOG_ERROR("{} batch results differ from the sequential ones", mismatches);
    }

    for (size_t i = 0; i < documents.size(); ++i) {
        stats[i].Show();

        json output;
        output["document"] = names[i];
        output["bytes"] = documents[i].text.size();
        output["detections"] = documents[i].detections.size();
        output["labels"] = refnum::LabelMapIO::ToJson(labels[i]);
        output["stats"] = stats[i].ToJson();
        output["runs"] = runsPerDocument;

        std::string jsonPath = outputDir + "/" + names[i] + "_result.json";
        std::ofstream jsonFile(jsonPath);
        if (!jsonFile.is_open()) {
            LOG_ERROR("Failed to open file for writing: {}", jsonPath);
            continue;
        }
        jsonFile << output.dump(4);
    }

    LOG_INFO("Results saved to: {}", outputDir);
    return mismatches > 0 ? 1 : 0;
}
