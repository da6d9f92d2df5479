#pragma once

#include "common/types.hpp"
#include "linguistics/phrase_normalizer.h"
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace refnum {

/**
 * @brief Finds "<phrase> <numeral>[, <numeral>...]" pairs in free text
 *
 * "The bag has a flexible main body 100 and a front flap 120." yields
 * 100 -> ["flexible main body"], 120 -> ["front flap"].
 *
 * Phrases may wrap across single line breaks. Text is scanned paragraph by
 * paragraph (blank lines separate them); paragraphs longer than
 * maxSegmentLength are split at sentence ends before matching.
 */
class PatternExtractor {
public:
    PatternExtractor(std::shared_ptr<const PhraseNormalizer> normalizer,
                     size_t maxSegmentLength = 1024);

    /**
     * @brief Raw matches, left to right, non-overlapping
     * Figure references ("FIG. 1") are already dropped.
     */
    std::vector<TextMatch> findMatches(const std::string& text) const;

    /**
     * @brief numeral -> candidate labels, in order of appearance
     * @param matchCount Set to the number of raw matches (optional)
     */
    CandidateTable extract(const std::string& text, size_t* matchCount = nullptr) const;

    /**
     * @brief 1 to 4 ASCII digits
     */
    static bool isReferenceNumeral(const std::string& token);

private:
    // [begin, end) byte ranges of the text, each at most maxSegmentLength_ long
    std::vector<std::pair<size_t, size_t>> segment(const std::string& text) const;

    // Parts of [begin, end) a match can lie in: runs of pattern characters,
    // each cut after its last numeral; runs without one are left out
    static std::vector<std::pair<size_t, size_t>> searchRanges(const std::string& text,
                                                               size_t begin, size_t end);

    std::shared_ptr<const PhraseNormalizer> normalizer_;
    size_t maxSegmentLength_;
    std::regex pattern_;
};

} // namespace refnum
