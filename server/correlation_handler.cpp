#include "correlation_handler.h"
#include "common/logger.hpp"
#include "correlation/detection_io.h"
#include <chrono>

namespace refnum_server {

CorrelationRequest CorrelationRequest::FromJson(const json& j) {
    CorrelationRequest req;

    if (j.contains("text") && j["text"].is_string()) {
        req.hasText = true;
        req.text = j["text"].get<std::string>();
    }

    if (j.contains("detections") && !j["detections"].is_null()) {
        if (!refnum::DetectionIO::FromJson(j["detections"], req.detections,
                                           req.detectionsError, &req.skippedDetections)) {
            req.detections.clear();
        }
    }

    if (j.contains("minConfidence")) req.minConfidence = j["minConfidence"].get<double>();
    if (j.contains("overlapThreshold")) req.overlapThreshold = j["overlapThreshold"].get<double>();

    return req;
}

bool CorrelationRequest::Validate(std::string& error_msg) const {
    if (!hasText) {
        error_msg = "Missing required parameter: 'text'";
        return false;
    }

    if (text.size() > kMaxTextBytes) {
        error_msg = "text exceeds " + std::to_string(kMaxTextBytes) + " bytes";
        return false;
    }

    if (!detectionsError.empty()) {
        error_msg = detectionsError;
        return false;
    }

    if (minConfidence && (*minConfidence < 0.0 || *minConfidence > 1.0)) {
        error_msg = "minConfidence must be in range [0.0, 1.0]";
        return false;
    }

    if (overlapThreshold && (*overlapThreshold < 0.0 || *overlapThreshold > 1.0)) {
        error_msg = "overlapThreshold must be in range [0.0, 1.0]";
        return false;
    }

    return true;
}

CorrelationHandler::CorrelationHandler(std::shared_ptr<const refnum::CorrelationEngine> engine)
    : engine_(std::move(engine)) {
}

int CorrelationHandler::HandleRequest(const CorrelationRequest& request, json& response_json) const {
    std::string error_msg;
    if (!request.Validate(error_msg)) {
        LOG_WARN("Invalid request: {}", error_msg);
        response_json = JsonResponseBuilder::BuildErrorResponse(ErrorCode::INVALID_PARAMETER, error_msg);
        return 400;
    }

    refnum::CorrelationStats stats;
    refnum::NumeralLabelMap labels;

    if (request.minConfidence || request.overlapThreshold) {
        const auto& base = engine_->config();
        auto engine = engine_->withDetectionThresholds(
            request.minConfidence ? static_cast<float>(*request.minConfidence) : base.minConfidence,
            request.overlapThreshold ? static_cast<float>(*request.overlapThreshold) : base.overlapThreshold);
        labels = engine.correlate(request.text, request.detections, &stats);
    } else {
        labels = engine_->correlate(request.text, request.detections, &stats);
    }
    stats.malformedDetections += static_cast<int>(request.skippedDetections);

    LOG_INFO("Correlated {} bytes of text and {} detections -> {} labels in {:.2f} ms",
             request.text.size(), request.detections.size(), labels.size(), stats.totalTime);

    response_json = JsonResponseBuilder::BuildSuccessResponse(labels, &stats);
    return 200;
}

int CorrelationHandler::HandleExtract(const CorrelationRequest& request, json& response_json) const {
    std::string error_msg;
    if (!request.Validate(error_msg)) {
        LOG_WARN("Invalid request: {}", error_msg);
        response_json = JsonResponseBuilder::BuildErrorResponse(ErrorCode::INVALID_PARAMETER, error_msg);
        return 400;
    }

    auto start = std::chrono::high_resolution_clock::now();
    refnum::NumeralLabelMap labels = engine_->extractAndNormalize(request.text);
    auto end = std::chrono::high_resolution_clock::now();

    LOG_INFO("Extracted {} labels from {} bytes in {:.2f} ms", labels.size(), request.text.size(),
             std::chrono::duration<double, std::milli>(end - start).count());

    response_json = JsonResponseBuilder::BuildSuccessResponse(labels);
    return 200;
}

} // namespace refnum_server
