#include "common/config.h"
#include "common/logger.hpp"
#include <cmath>
#include <fstream>

namespace refnum {

const char* OverlapModeName(OverlapMode mode) {
    switch (mode) {
        case OverlapMode::BoundingBox: return "bbox";
        case OverlapMode::Polygon:     return "polygon";
    }
    return "unknown";
}

const char* LabelPolicyName(LabelPolicy policy) {
    switch (policy) {
        case LabelPolicy::Shortest:     return "shortest";
        case LabelPolicy::MostFrequent: return "most_frequent";
    }
    return "unknown";
}

bool ParseOverlapMode(const std::string& name, OverlapMode& mode) {
    if (name == "bbox") {
        mode = OverlapMode::BoundingBox;
        return true;
    }
    if (name == "polygon") {
        mode = OverlapMode::Polygon;
        return true;
    }
    return false;
}

bool ParseLabelPolicy(const std::string& name, LabelPolicy& policy) {
    if (name == "shortest") {
        policy = LabelPolicy::Shortest;
        return true;
    }
    if (name == "most_frequent") {
        policy = LabelPolicy::MostFrequent;
        return true;
    }
    return false;
}

// ==================== CorrelationConfig ====================

void CorrelationConfig::Show() const {
    LOG_INFO("========== Correlation Configuration ==========");
    LOG_INFO("  Min Confidence:     {:.2f}", minConfidence);
    LOG_INFO("  Digit Ratio:        {:.2f}", digitRatio);
    LOG_INFO("  Overlap Threshold:  {:.2f}", overlapThreshold);
    LOG_INFO("  Overlap Mode:       {}", OverlapModeName(overlapMode));
    LOG_INFO("  Label Policy:       {}", LabelPolicyName(labelPolicy));
    LOG_INFO("  Max Segment Length: {}", maxSegmentLength);
    LOG_INFO("  Lexicon:            {}", lexiconPath);
    LOG_INFO("  Extra Stopwords:    {}", extraStopwords.size());
    LOG_INFO("===============================================");
}

CorrelationConfig CorrelationConfig::FromJson(const json& j) {
    CorrelationConfig config;

    if (j.contains("minConfidence")) config.minConfidence = j["minConfidence"].get<float>();
    if (j.contains("digitRatio")) config.digitRatio = j["digitRatio"].get<float>();
    if (j.contains("overlapThreshold")) config.overlapThreshold = j["overlapThreshold"].get<float>();
    if (j.contains("maxSegmentLength")) config.maxSegmentLength = j["maxSegmentLength"].get<size_t>();
    if (j.contains("lexiconPath")) config.lexiconPath = j["lexiconPath"].get<std::string>();
    if (j.contains("extraStopwords")) {
        config.extraStopwords = j["extraStopwords"].get<std::vector<std::string>>();
    }

    // Unknown names keep the default and are reported by the caller's Show()
    if (j.contains("overlapMode")) {
        std::string name = j["overlapMode"].get<std::string>();
        if (!ParseOverlapMode(name, config.overlapMode)) {
            LOG_WARN("Unknown overlapMode '{}', using {}", name, OverlapModeName(config.overlapMode));
        }
    }
    if (j.contains("labelPolicy")) {
        std::string name = j["labelPolicy"].get<std::string>();
        if (!ParseLabelPolicy(name, config.labelPolicy)) {
            LOG_WARN("Unknown labelPolicy '{}', using {}", name, LabelPolicyName(config.labelPolicy));
        }
    }

    return config;
}

json CorrelationConfig::ToJson() const {
    json j;
    j["minConfidence"] = minConfidence;
    j["digitRatio"] = digitRatio;
    j["overlapThreshold"] = overlapThreshold;
    j["overlapMode"] = OverlapModeName(overlapMode);
    j["labelPolicy"] = LabelPolicyName(labelPolicy);
    j["maxSegmentLength"] = maxSegmentLength;
    j["lexiconPath"] = lexiconPath;
    j["extraStopwords"] = extraStopwords;
    return j;
}

bool CorrelationConfig::Validate(std::string& error_msg) const {
    if (!std::isfinite(minConfidence) || minConfidence < 0.0f || minConfidence > 1.0f) {
        error_msg = "minConfidence must be in range [0.0, 1.0]";
        return false;
    }

    if (!std::isfinite(digitRatio) || digitRatio <= 0.0f || digitRatio > 1.0f) {
        error_msg = "digitRatio must be in range (0.0, 1.0]";
        return false;
    }

    if (!std::isfinite(overlapThreshold) || overlapThreshold < 0.0f || overlapThreshold > 1.0f) {
        error_msg = "overlapThreshold must be in range [0.0, 1.0]";
        return false;
    }

    if (maxSegmentLength < 64) {
        error_msg = "maxSegmentLength must be at least 64";
        return false;
    }

    for (const auto& word : extraStopwords) {
        if (word.empty()) {
            error_msg = "extraStopwords must not contain empty entries";
            return false;
        }
    }

    return true;
}

bool LoadConfigFromFile(const std::string& path, CorrelationConfig& config, std::string& error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "Cannot open config file: " + path;
        return false;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            error_msg = "Config root must be a JSON object: " + path;
            return false;
        }
        config = CorrelationConfig::FromJson(j);
    } catch (const json::exception& e) {
        error_msg = std::string("Invalid config file: ") + e.what();
        return false;
    }

    if (!config.Validate(error_msg)) {
        return false;
    }

    LOG_INFO("Loaded configuration from: {}", path);
    return true;
}

} // namespace refnum
