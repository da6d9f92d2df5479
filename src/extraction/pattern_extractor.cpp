#include "extraction/pattern_extractor.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

namespace refnum {

namespace {

// Optional lead-in ("... indicated generally as"), lazy phrase, then a
// comma-separated list of numbers of 1 to 4 digits, none followed by a digit.
// "503a" yields 503; "12345" yields nothing.
const char* const kCandidatePattern =
    "(?:[\\w\\s\\-,;:\\(\\)]*?\\s"
    "(?:indicated\\s+(?:generally\\s+)?as|identified\\s+as|as|no\\.?|"
    "reference\\s+numerals?|shown\\s+as)\\s+)?"
    "([\\w\\s\\-\\.,;:\\(\\)]+?)\\s*\\b(\\d{1,4}(?:,\\s*\\d{1,4})*)(?!\\d)";

bool isSentenceEnd(char c) {
    return c == '.' || c == '!' || c == '?' || c == ';';
}

bool isWordChar(unsigned char c) {
    return c < 0x80 && (std::isalnum(c) || c == '_');
}

// Characters the pattern can consume; a match never spans anything else
bool isPatternChar(unsigned char c) {
    if (c >= 0x80) return false;
    if (std::isalnum(c) || c == '_' || std::isspace(c)) return true;
    switch (c) {
        case '-': case '.': case ',': case ';': case ':': case '(': case ')':
            return true;
        default:
            return false;
    }
}

// Index just past the last run of 1-4 digits that starts a word in
// [begin, end), or begin when there is none. Every match ends on such a run.
size_t lastNumeralEnd(const std::string& text, size_t begin, size_t end) {
    size_t k = end;
    while (k > begin) {
        if (!std::isdigit(static_cast<unsigned char>(text[k - 1]))) {
            k--;
            continue;
        }
        size_t runEnd = k;
        while (k > begin && std::isdigit(static_cast<unsigned char>(text[k - 1]))) {
            k--;
        }
        bool startsWord = k == begin || !isWordChar(static_cast<unsigned char>(text[k - 1]));
        if (startsWord && runEnd - k <= 4) {
            return runEnd;
        }
    }
    return begin;
}

// Blank line: '\n', optional blanks, '\n'. Returns the position of the first
// '\n' of the next paragraph break at or after pos, npos if none.
size_t findParagraphBreak(const std::string& text, size_t pos) {
    while ((pos = text.find('\n', pos)) != std::string::npos) {
        size_t k = pos + 1;
        while (k < text.size() && (text[k] == ' ' || text[k] == '\t' || text[k] == '\r')) {
            k++;
        }
        if (k < text.size() && text[k] == '\n') {
            return pos;
        }
        pos = k;
    }
    return std::string::npos;
}

std::string trimSpaces(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

PatternExtractor::PatternExtractor(std::shared_ptr<const PhraseNormalizer> normalizer,
                                   size_t maxSegmentLength)
    : normalizer_(std::move(normalizer)),
      maxSegmentLength_(std::max<size_t>(maxSegmentLength, 64)),
      pattern_(kCandidatePattern, std::regex::icase) {
}

bool PatternExtractor::isReferenceNumeral(const std::string& token) {
    if (token.empty() || token.size() > 4) {
        return false;
    }
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return c >= '0' && c <= '9'; });
}

std::vector<std::pair<size_t, size_t>> PatternExtractor::segment(const std::string& text) const {
    std::vector<std::pair<size_t, size_t>> segments;
    size_t n = text.size();
    size_t pos = 0;

    while (pos < n) {
        size_t paragraphEnd = findParagraphBreak(text, pos);
        if (paragraphEnd == std::string::npos) {
            paragraphEnd = n;
        }

        size_t start = pos;
        while (paragraphEnd - start > maxSegmentLength_) {
            size_t limit = start + maxSegmentLength_;
            size_t cut = std::string::npos;

            // Prefer the last sentence end, then the last blank, then a hard cut
            for (size_t k = limit - 1; k > start; k--) {
                if (isSentenceEnd(text[k]) && std::isspace(static_cast<unsigned char>(text[k + 1]))) {
                    cut = k + 1;
                    break;
                }
            }
            if (cut == std::string::npos) {
                for (size_t k = limit - 1; k > start; k--) {
                    if (std::isspace(static_cast<unsigned char>(text[k]))) {
                        cut = k;
                        break;
                    }
                }
            }
            if (cut == std::string::npos) {
                cut = limit;
            }

            segments.emplace_back(start, cut);
            start = cut;
        }

        if (start < paragraphEnd) {
            segments.emplace_back(start, paragraphEnd);
        }
        pos = paragraphEnd + 1;
    }

    return segments;
}

std::vector<std::pair<size_t, size_t>> PatternExtractor::searchRanges(const std::string& text,
                                                                       size_t begin, size_t end) {
    std::vector<std::pair<size_t, size_t>> ranges;
    size_t pos = begin;

    while (pos < end) {
        while (pos < end && !isPatternChar(static_cast<unsigned char>(text[pos]))) {
            pos++;
        }
        size_t runStart = pos;
        while (pos < end && isPatternChar(static_cast<unsigned char>(text[pos]))) {
            pos++;
        }

        size_t runEnd = lastNumeralEnd(text, runStart, pos);
        if (runEnd > runStart) {
            ranges.emplace_back(runStart, runEnd);
        }
    }

    return ranges;
}

std::vector<TextMatch> PatternExtractor::findMatches(const std::string& text) const {
    std::vector<TextMatch> matches;

    for (const auto& segmentRange : segment(text)) {
        for (const auto& range : searchRanges(text, segmentRange.first, segmentRange.second)) {
            const std::string piece = text.substr(range.first, range.second - range.first);

            auto begin = std::sregex_iterator(piece.begin(), piece.end(), pattern_);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const std::smatch& m = *it;
                std::string phrase = m[1].str();

                if (PhraseNormalizer::containsFigureReference(phrase) ||
                    PhraseNormalizer::endsWithFigureToken(phrase)) {
                    LOG_TRACE("Skipping figure reference '{}'", m[0].str());
                    continue;
                }

                TextMatch match;
                match.rawPhrase = phrase;
                match.begin = range.first + static_cast<size_t>(m.position(0));
                match.end = match.begin + static_cast<size_t>(m.length(0));

                std::string numbers = m[2].str();
                size_t start = 0;
                while (start <= numbers.size()) {
                    size_t comma = numbers.find(',', start);
                    if (comma == std::string::npos) {
                        comma = numbers.size();
                    }
                    std::string token = trimSpaces(numbers.substr(start, comma - start));
                    if (isReferenceNumeral(token)) {
                        match.numerals.push_back(token);
                    }
                    start = comma + 1;
                }

                if (!match.numerals.empty()) {
                    matches.push_back(std::move(match));
                }
            }
        }
    }

    return matches;
}

CandidateTable PatternExtractor::extract(const std::string& text, size_t* matchCount) const {
    CandidateTable table;

    std::vector<TextMatch> matches = findMatches(text);
    if (matchCount) {
        *matchCount = matches.size();
    }

    for (const auto& match : matches) {
        std::string label = normalizer_->normalize(match.rawPhrase);
        if (label.empty()) {
            continue;
        }

        for (const auto& numeral : match.numerals) {
            NumeralCandidate& candidate = table[numeral];
            candidate.numeral = numeral;
            candidate.source = CandidateSource::TEXT;
            candidate.labelCandidates.push_back(label);
        }
    }

    LOG_DEBUG("Extracted {} candidate numerals", table.size());
    return table;
}

} // namespace refnum
