#pragma once

#include "common/config.h"
#include "common/types.hpp"
#include "digits/detection_dedup.h"
#include "digits/digit_corrector.h"
#include "extraction/pattern_extractor.h"
#include "linguistics/language_model.h"
#include "linguistics/phrase_normalizer.h"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace refnum {

/**
 * @brief Per-call timings and counters
 */
struct CorrelationStats {
    double extractionTime = 0.0;     // text -> candidate table (ms)
    double filterTime = 0.0;         // digit correction and filtering (ms)
    double dedupTime = 0.0;          // overlap suppression (ms)
    double mergeTime = 0.0;          // label choice (ms)
    double totalTime = 0.0;          // (ms)

    int textMatches = 0;
    int candidateNumerals = 0;
    int validatedNumbers = 0;
    int dedupedNumbers = 0;
    int malformedDetections = 0;
    int confirmedNumerals = 0;       // labelled and seen in the drawing
    int textOnlyNumerals = 0;        // labelled, text only

    void Show() const;
    json ToJson() const;
};

/**
 * @brief One document for batch correlation
 */
struct CorrelationInput {
    std::string text;
    std::vector<Detection> detections;
};

/**
 * @brief Pairs drawing numerals with the labels the text gives them
 *
 * 1. Text: pattern extraction + normalization -> numeral -> candidate labels
 * 2. Image: digit correction + filtering + dedup -> numerals present
 * 3. Merge: one label per numeral, image-confirmed numerals first
 *
 * All methods are const and may be called from several threads at once.
 */
class CorrelationEngine {
public:
    /**
     * @param config Thresholds and policies (assumed validated)
     * @param model Shared tagger; nullptr degrades labels to lower-cased phrases
     */
    CorrelationEngine(const CorrelationConfig& config,
                      std::shared_ptr<const LanguageModel> model);

    /**
     * @brief Text-only mapping
     */
    NumeralLabelMap extractAndNormalize(const std::string& text) const;

    /**
     * @brief Text + detections mapping
     * @param stats Filled when not null
     */
    NumeralLabelMap correlate(const std::string& text,
                              const std::vector<Detection>& detections,
                              CorrelationStats* stats = nullptr) const;

    /**
     * @brief correlate() over independent documents on a worker pool
     * @param numThreads 0 picks the hardware concurrency
     * @return One mapping per input, same order
     */
    std::vector<NumeralLabelMap> correlateBatch(const std::vector<CorrelationInput>& inputs,
                                                size_t numThreads = 0) const;

    /**
     * @brief Corrected digit strings of the detections that survive filtering and dedup
     */
    std::set<std::string> presentNumerals(const std::vector<Detection>& detections,
                                          CorrelationStats* stats = nullptr) const;

    /**
     * @brief Same engine with other detection thresholds, sharing the text pipeline
     */
    CorrelationEngine withDetectionThresholds(float minConfidence, float overlapThreshold) const;

    /**
     * @brief Pick one label among a numeral's candidates
     * @return Empty string for no candidates
     */
    static std::string chooseLabel(const std::vector<std::string>& candidates,
                                   LabelPolicy policy);

    const CorrelationConfig& config() const { return config_; }
    bool hasModel() const { return normalizer_->hasModel(); }

private:
    CorrelationConfig config_;
    std::shared_ptr<const PhraseNormalizer> normalizer_;
    std::shared_ptr<const PatternExtractor> extractor_;
    DigitCorrector corrector_;
    DetectionDeduplicator deduplicator_;
};

} // namespace refnum
