#include "correlation/correlation_engine.h"
#include "common/logger.hpp"
#include "common/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <unordered_map>

namespace refnum {

namespace {

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

double percentOf(double part, double total) {
    return total > 0 ? part / total * 100 : 0;
}

} // namespace

void CorrelationStats::Show() const {
    LOG_INFO("========== Correlation Statistics ==========");
    LOG_INFO("Extraction:  {:.2f} ms ({:.1f}%)", extractionTime, percentOf(extractionTime, totalTime));
    LOG_INFO("Filtering:   {:.2f} ms ({:.1f}%)", filterTime, percentOf(filterTime, totalTime));
    LOG_INFO("Dedup:       {:.2f} ms ({:.1f}%)", dedupTime, percentOf(dedupTime, totalTime));
    LOG_INFO("Merge:       {:.2f} ms ({:.1f}%)", mergeTime, percentOf(mergeTime, totalTime));
    LOG_INFO("Total Time:  {:.2f} ms", totalTime);
    LOG_INFO("Text: {} matches -> {} numerals", textMatches, candidateNumerals);
    LOG_INFO("Image: {} validated -> {} after dedup ({} malformed skipped)",
             validatedNumbers, dedupedNumbers, malformedDetections);
    LOG_INFO("Labels: {} confirmed | {} text only", confirmedNumerals, textOnlyNumerals);
    LOG_INFO("============================================");
}

json CorrelationStats::ToJson() const {
    json j;
    j["extractionTime"] = extractionTime;
    j["filterTime"] = filterTime;
    j["dedupTime"] = dedupTime;
    j["mergeTime"] = mergeTime;
    j["totalTime"] = totalTime;
    j["textMatches"] = textMatches;
    j["candidateNumerals"] = candidateNumerals;
    j["validatedNumbers"] = validatedNumbers;
    j["dedupedNumbers"] = dedupedNumbers;
    j["malformedDetections"] = malformedDetections;
    j["confirmedNumerals"] = confirmedNumerals;
    j["textOnlyNumerals"] = textOnlyNumerals;
    return j;
}

CorrelationEngine::CorrelationEngine(const CorrelationConfig& config,
                                     std::shared_ptr<const LanguageModel> model)
    : config_(config),
      normalizer_(std::make_shared<PhraseNormalizer>(std::move(model), config.extraStopwords)),
      extractor_(std::make_shared<PatternExtractor>(normalizer_, config.maxSegmentLength)),
      corrector_(config.minConfidence, config.digitRatio),
      deduplicator_(config.overlapThreshold, config.overlapMode) {
}

CorrelationEngine CorrelationEngine::withDetectionThresholds(float minConfidence,
                                                             float overlapThreshold) const {
    CorrelationEngine engine(*this);
    engine.config_.minConfidence = minConfidence;
    engine.config_.overlapThreshold = overlapThreshold;
    engine.corrector_ = DigitCorrector(minConfidence, config_.digitRatio);
    engine.deduplicator_ = DetectionDeduplicator(overlapThreshold, config_.overlapMode);
    return engine;
}

std::string CorrelationEngine::chooseLabel(const std::vector<std::string>& candidates,
                                           LabelPolicy policy) {
    if (candidates.empty()) {
        return "";
    }

    if (policy == LabelPolicy::MostFrequent) {
        std::unordered_map<std::string, int> counts;
        for (const auto& label : candidates) {
            counts[label]++;
        }

        const std::string* best = &candidates[0];
        for (const auto& label : candidates) {
            int count = counts[label];
            int bestCount = counts[*best];
            if (count > bestCount || (count == bestCount && label.size() < best->size())) {
                best = &label;
            }
        }
        return *best;
    }

    const std::string* best = &candidates[0];
    for (const auto& label : candidates) {
        if (label.size() < best->size()) {
            best = &label;
        }
    }
    return *best;
}

NumeralLabelMap CorrelationEngine::extractAndNormalize(const std::string& text) const {
    NumeralLabelMap result;
    for (const auto& entry : extractor_->extract(text)) {
        std::string label = chooseLabel(entry.second.labelCandidates, config_.labelPolicy);
        if (!label.empty()) {
            result[entry.first] = label;
        }
    }
    return result;
}

std::set<std::string> CorrelationEngine::presentNumerals(const std::vector<Detection>& detections,
                                                         CorrelationStats* stats) const {
    auto start_filter = std::chrono::high_resolution_clock::now();
    size_t malformed = 0;
    std::vector<ValidatedNumber> valid = corrector_.filterValid(detections, &malformed);
    double filter_time = elapsedMs(start_filter);

    auto start_dedup = std::chrono::high_resolution_clock::now();
    std::vector<ValidatedNumber> unique = deduplicator_.dedup(valid);
    double dedup_time = elapsedMs(start_dedup);

    std::set<std::string> present;
    for (const auto& vn : unique) {
        present.insert(vn.correctedText);
    }

    if (stats) {
        stats->filterTime = filter_time;
        stats->dedupTime = dedup_time;
        stats->validatedNumbers = static_cast<int>(valid.size());
        stats->dedupedNumbers = static_cast<int>(unique.size());
        stats->malformedDetections = static_cast<int>(malformed);
    }
    return present;
}

NumeralLabelMap CorrelationEngine::correlate(const std::string& text,
                                             const std::vector<Detection>& detections,
                                             CorrelationStats* stats) const {
    auto start_total = std::chrono::high_resolution_clock::now();

    auto start_extract = std::chrono::high_resolution_clock::now();
    size_t matchCount = 0;
    CandidateTable candidates = extractor_->extract(text, &matchCount);
    double extract_time = elapsedMs(start_extract);

    std::set<std::string> present = presentNumerals(detections, stats);

    auto start_merge = std::chrono::high_resolution_clock::now();
    NumeralLabelMap result;
    int confirmed = 0;
    int textOnly = 0;

    // Numerals seen in the drawing first, then the ones only the text names
    for (const auto& numeral : present) {
        auto it = candidates.find(numeral);
        if (it == candidates.end()) {
            continue;
        }
        std::string label = chooseLabel(it->second.labelCandidates, config_.labelPolicy);
        if (!label.empty()) {
            result[numeral] = label;
            confirmed++;
        }
    }
    for (const auto& entry : candidates) {
        if (result.count(entry.first) > 0) {
            continue;
        }
        std::string label = chooseLabel(entry.second.labelCandidates, config_.labelPolicy);
        if (!label.empty()) {
            result[entry.first] = label;
            textOnly++;
        }
    }
    double merge_time = elapsedMs(start_merge);

    if (stats) {
        stats->extractionTime = extract_time;
        stats->mergeTime = merge_time;
        stats->textMatches = static_cast<int>(matchCount);
        stats->candidateNumerals = static_cast<int>(candidates.size());
        stats->confirmedNumerals = confirmed;
        stats->textOnlyNumerals = textOnly;
        stats->totalTime = elapsedMs(start_total);
    }

    LOG_DEBUG("Correlated {} numerals ({} confirmed by the drawing)", result.size(), confirmed);
    return result;
}

std::vector<NumeralLabelMap> CorrelationEngine::correlateBatch(const std::vector<CorrelationInput>& inputs,
                                                               size_t numThreads) const {
    if (inputs.empty()) {
        return {};
    }
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
    }
    numThreads = std::min(numThreads == 0 ? size_t(4) : numThreads, inputs.size());

    ThreadPool pool(numThreads);
    LOG_DEBUG("Correlating {} documents on {} threads", inputs.size(), pool.size());
    return pool.map(inputs, [this](const CorrelationInput& input) {
        return correlate(input.text, input.detections);
    });
}

} // namespace refnum
