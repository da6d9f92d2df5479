#pragma once

#include "correlation/correlation_engine.h"
#include "json_response.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace refnum_server {

/**
 * @brief Body of /extract and /correlate
 */
struct CorrelationRequest {
    static constexpr size_t kMaxTextBytes = 8 * 1024 * 1024;

    bool hasText = false;
    std::string text;                           // patent text, required
    std::vector<refnum::Detection> detections;  // optional OCR records
    size_t skippedDetections = 0;               // records without text/score/box
    std::string detectionsError;                // set when "detections" has no accepted shape

    // Per-request overrides of the engine configuration
    std::optional<double> minConfidence;
    std::optional<double> overlapThreshold;

    /**
     * @brief Read the request body
     * @throws json::exception on wrongly typed fields
     */
    static CorrelationRequest FromJson(const json& j);

    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Runs requests against the shared engine
 */
class CorrelationHandler {
public:
    explicit CorrelationHandler(std::shared_ptr<const refnum::CorrelationEngine> engine);

    /**
     * @brief /correlate
     * @return HTTP status code
     */
    int HandleRequest(const CorrelationRequest& request, json& response_json) const;

    /**
     * @brief /extract (text only, detections are ignored)
     * @return HTTP status code
     */
    int HandleExtract(const CorrelationRequest& request, json& response_json) const;

private:
    std::shared_ptr<const refnum::CorrelationEngine> engine_;
};

} // namespace refnum_server
