#include "correlation/detection_io.h"
#include "common/logger.hpp"
#include <fstream>

namespace refnum {

namespace {

const json* findField(const json& record, const char* name, const char* alias) {
    if (record.contains(name)) return &record[name];
    if (record.contains(alias)) return &record[alias];
    return nullptr;
}

bool parsePoint(const json& p, cv::Point2f& point) {
    if (p.is_array() && p.size() == 2 && p[0].is_number() && p[1].is_number()) {
        point = cv::Point2f(p[0].get<float>(), p[1].get<float>());
        return true;
    }
    if (p.is_object() && p.contains("x") && p.contains("y") &&
        p["x"].is_number() && p["y"].is_number()) {
        point = cv::Point2f(p["x"].get<float>(), p["y"].get<float>());
        return true;
    }
    return false;
}

} // namespace

bool DetectionIO::ParseRecord(const json& record, Detection& detection, std::string& error_msg) {
    if (!record.is_object()) {
        error_msg = "record is not an object";
        return false;
    }

    const json* text = findField(record, "text", "prunedResult");
    if (!text || !text->is_string()) {
        error_msg = "missing text";
        return false;
    }

    const json* confidence = findField(record, "confidence", "score");
    if (!confidence || !confidence->is_number()) {
        error_msg = "missing confidence";
        return false;
    }

    const json* box = findField(record, "box", "points");
    if (!box || !box->is_array()) {
        error_msg = "missing box";
        return false;
    }

    std::vector<cv::Point2f> points;
    for (const auto& p : *box) {
        cv::Point2f point;
        if (!parsePoint(p, point)) {
            error_msg = "box point is neither [x, y] nor {x, y}";
            return false;
        }
        points.push_back(point);
    }

    // Point count and confidence range are checked by the digit filter
    detection = Detection(std::move(points), text->get<std::string>(), confidence->get<float>());
    return true;
}

bool DetectionIO::FromJson(const json& j, std::vector<Detection>& detections,
                           std::string& error_msg, size_t* skipped) {
    const json* records = nullptr;
    if (j.is_array()) {
        records = &j;
    } else if (j.is_object() && j.contains("results") && j["results"].is_array()) {
        records = &j["results"];
    } else if (j.is_object() && j.contains("result") && j["result"].is_object() &&
               j["result"].contains("ocrResults") && j["result"]["ocrResults"].is_array()) {
        records = &j["result"]["ocrResults"];
    }

    if (!records) {
        error_msg = "Detections must be an array, {\"results\": [...]} or {\"result\": {\"ocrResults\": [...]}}";
        return false;
    }

    detections.clear();
    detections.reserve(records->size());
    for (size_t i = 0; i < records->size(); i++) {
        Detection detection;
        std::string reason;
        if (!ParseRecord((*records)[i], detection, reason)) {
            LOG_WARN("Skipping detection record #{}: {}", i, reason);
            if (skipped) (*skipped)++;
            continue;
        }
        detections.push_back(std::move(detection));
    }

    return true;
}

bool DetectionIO::LoadFromJSON(const std::string& path, std::vector<Detection>& detections,
                               std::string& error_msg) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error_msg = "Cannot open detections file: " + path;
        return false;
    }

    try {
        if (!FromJson(json::parse(ifs), detections, error_msg)) {
            return false;
        }
    } catch (const json::exception& e) {
        error_msg = std::string("Invalid detections JSON: ") + e.what();
        return false;
    }

    LOG_INFO("Loaded {} detections from: {}", detections.size(), path);
    return true;
}

json DetectionIO::ToJson(const std::vector<Detection>& detections) {
    json records = json::array();
    for (const auto& det : detections) {
        json item;
        item["text"] = det.text;
        item["confidence"] = det.confidence;
        json box = json::array();
        for (const auto& pt : det.box) {
            box.push_back({pt.x, pt.y});
        }
        item["box"] = box;
        records.push_back(item);
    }
    return records;
}

} // namespace refnum
