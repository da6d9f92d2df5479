#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace refnum {

using json = nlohmann::json;

/**
 * @brief Overlap measure used by the detection deduplicator
 */
enum class OverlapMode {
    BoundingBox,   // axis-aligned rectangles from min/max x/y
    Polygon        // convex polygon intersection
};

/**
 * @brief How one label is picked among a numeral's candidates
 */
enum class LabelPolicy {
    Shortest,      // shortest string, ties to first seen
    MostFrequent   // most repeated, ties to shortest then first seen
};

const char* OverlapModeName(OverlapMode mode);
const char* LabelPolicyName(LabelPolicy policy);
bool ParseOverlapMode(const std::string& name, OverlapMode& mode);
bool ParseLabelPolicy(const std::string& name, LabelPolicy& policy);

/**
 * @brief Correlation engine configuration
 */
struct CorrelationConfig {
    // Digit corrector
    float minConfidence = 0.6f;          // detections below are dropped
    float digitRatio = 0.7f;             // share of digits that still counts as numeric

    // Deduplicator
    float overlapThreshold = 0.5f;       // IoU above which two detections are the same glyphs
    OverlapMode overlapMode = OverlapMode::BoundingBox;

    // Merge
    LabelPolicy labelPolicy = LabelPolicy::Shortest;

    // Pattern extractor
    size_t maxSegmentLength = 1024;      // longer lines are split at sentence ends

    // Normalizer
    std::string lexiconPath = "models/en_lexicon.json";
    std::vector<std::string> extraStopwords;

    void Show() const;

    /**
     * @brief Read fields present in the JSON object, keep defaults for the rest
     * @throws json::exception on wrongly typed fields
     */
    static CorrelationConfig FromJson(const json& j);

    json ToJson() const;

    /**
     * @brief Check value ranges
     */
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Load and validate a configuration file
 * @return false (and error_msg set) if the file is unreadable or invalid
 */
bool LoadConfigFromFile(const std::string& path, CorrelationConfig& config, std::string& error_msg);

} // namespace refnum
