#pragma once

#include "common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace refnum {

/**
 * @brief Repairs OCR misreads of digits and keeps the numeric detections
 *
 * Glyph table: b/B->6, o/O->0, l/I/i->1, S/s->5, Z/z->2, g/G/q/Q->9, D->0, T/t->7.
 */
class DigitCorrector {
public:
    DigitCorrector(float minConfidence = 0.6f, float digitRatio = 0.7f);

    /**
     * @brief Substitute confusable glyphs, then drop everything but digits and '.'
     */
    static std::string correct(const std::string& rawText);

    /**
     * @brief Numeric after removing non-word characters (float parse or digit ratio)
     */
    bool isNumber(const std::string& text) const;

    /**
     * @brief Validated numbers among the detections, in input order
     * @param skipped Incremented once per malformed detection (optional)
     */
    std::vector<ValidatedNumber> filterValid(const std::vector<Detection>& detections,
                                             size_t* skipped = nullptr) const;

    /**
     * @brief Whole-string decimal float parse ("12.5", "3e2"); nullopt otherwise
     */
    static std::optional<double> parseFloat(const std::string& text);

    float minConfidence() const { return minConfidence_; }
    float digitRatio() const { return digitRatio_; }

private:
    float minConfidence_;
    float digitRatio_;
};

} // namespace refnum
