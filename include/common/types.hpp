#pragma once

#include "common/geometry.h"
#include <opencv2/core.hpp>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace refnum {

/**
 * Text region reported by the OCR collaborator
 */
struct Detection {
    // Quad in image coordinates (4 points, any winding)
    std::vector<cv::Point2f> box;

    // Recognized text and score in [0, 1]
    std::string text;
    float confidence = 0.0f;

    Detection() = default;
    Detection(std::vector<cv::Point2f> points, std::string txt, float conf)
        : box(std::move(points)), text(std::move(txt)), confidence(conf) {}

    // Box has 4 finite points and the confidence is a probability
    bool isWellFormed() const {
        if (box.size() != 4) return false;
        for (const auto& pt : box) {
            if (!std::isfinite(pt.x) || !std::isfinite(pt.y)) return false;
        }
        return std::isfinite(confidence) && confidence >= 0.0f && confidence <= 1.0f;
    }

    // Axis-aligned bounding rectangle of the quad
    cv::Rect2f getBoundingRect() const {
        return Geometry::boundingRect(box);
    }

    void Show() const {
        std::cout << "  Detection: \"" << text << "\" (conf=" << confidence << ")" << std::endl;
        std::cout << "    Points: [";
        for (size_t i = 0; i < box.size(); i++) {
            std::cout << (i ? ", " : "") << box[i];
        }
        std::cout << "]" << std::endl;
    }
};

/**
 * Detection that survived digit correction and filtering
 */
struct ValidatedNumber {
    std::vector<cv::Point2f> box;
    std::string originalText;    // OCR reading as reported
    std::string correctedText;   // digits (and '.') after glyph correction
    double value = 0.0;
    float confidence = 0.0f;
};

/**
 * Phrase + number list found in free text (transient)
 */
struct TextMatch {
    std::string rawPhrase;
    std::vector<std::string> numerals;   // in order of appearance
    size_t begin = 0;                    // byte span [begin, end) in the source text
    size_t end = 0;
};

enum class CandidateSource {
    TEXT
};

/**
 * All labels proposed for one reference numeral by one document
 */
struct NumeralCandidate {
    std::string numeral;                       // 1-4 digits
    std::vector<std::string> labelCandidates;  // insertion order = text order
    CandidateSource source = CandidateSource::TEXT;
};

using CandidateTable = std::map<std::string, NumeralCandidate>;

// numeral -> chosen label
using NumeralLabelMap = std::map<std::string, std::string>;

} // namespace refnum
