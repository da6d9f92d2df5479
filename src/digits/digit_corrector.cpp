#include "digits/digit_corrector.h"
#include "common/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace refnum {

namespace {

char correctGlyph(char c) {
    switch (c) {
        case 'b': case 'B':
            return '6';
        case 'o': case 'O': case 'D':
            return '0';
        case 'l': case 'I': case 'i':
            return '1';
        case 'S': case 's':
            return '5';
        case 'Z': case 'z':
            return '2';
        case 'g': case 'G': case 'q': case 'Q':
            return '9';
        case 'T': case 't':
            return '7';
        default:
            return c;
    }
}

} // namespace

DigitCorrector::DigitCorrector(float minConfidence, float digitRatio)
    : minConfidence_(minConfidence), digitRatio_(digitRatio) {
}

std::string DigitCorrector::correct(const std::string& rawText) {
    std::string digits;
    digits.reserve(rawText.size());
    for (char c : rawText) {
        char fixed = correctGlyph(c);
        if (std::isdigit(static_cast<unsigned char>(fixed)) || fixed == '.') {
            digits += fixed;
        }
    }
    return digits;
}

std::optional<double> DigitCorrector::parseFloat(const std::string& text) {
    // Decimal notation only: no hex, inf or nan
    if (text.empty() || text.find_first_not_of("0123456789.eE+-") != std::string::npos) {
        return std::nullopt;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end != begin + text.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

bool DigitCorrector::isNumber(const std::string& text) const {
    std::string cleaned;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '.') {
            cleaned += c;
        }
    }
    if (cleaned.empty()) {
        return false;
    }

    if (parseFloat(cleaned)) {
        return true;
    }

    size_t digits = 0;
    for (char c : cleaned) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits++;
        }
    }
    return static_cast<float>(digits) / static_cast<float>(cleaned.size()) >= digitRatio_;
}

std::vector<ValidatedNumber> DigitCorrector::filterValid(const std::vector<Detection>& detections,
                                                         size_t* skipped) const {
    std::vector<ValidatedNumber> numbers;

    for (size_t i = 0; i < detections.size(); i++) {
        const Detection& det = detections[i];

        if (!det.isWellFormed()) {
            LOG_WARN("Skipping malformed detection #{} ('{}', {} points, conf={})",
                     i, det.text, det.box.size(), det.confidence);
            if (skipped) (*skipped)++;
            continue;
        }

        if (det.confidence < minConfidence_) {
            continue;
        }

        std::string corrected = correct(det.text);
        if (corrected.empty() || !isNumber(corrected)) {
            continue;
        }

        auto value = parseFloat(corrected);
        if (!value || !std::isfinite(*value)) {
            continue;
        }

        ValidatedNumber vn;
        vn.box = det.box;
        vn.originalText = det.text;
        vn.correctedText = corrected;
        vn.value = *value;
        vn.confidence = det.confidence;
        numbers.push_back(std::move(vn));
    }

    LOG_DEBUG("Validated {} of {} detections", numbers.size(), detections.size());
    return numbers;
}

} // namespace refnum
