#include "linguistics/phrase_normalizer.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace refnum {

namespace {

const char* const kStopwordPattern =
    "wherein|each|the|and|a|an|when|all|of|may be|is|are|with|such as|general(?:ly)?|"
    "indicated|identified|reference numerals?|numerals?|no|shown|that defines|controlled be|may be made of|"
    "or includes|i\\.e\\.|e\\.g\\.|as by|in use|considering again|be it|some other|"
    "one embodiment|roughly|such that|whether by|to the extent that|as suggested by|"
    "mounted|attached|respectively|similarly|or|this|that|these|those|some|any|every|"
    "either|neither|both|few|many|much|more|most|other|such|what|however|within|without|"
    "comprises?|comprising|includes?|including|having|being|noting|shows?|showing";

const char* const kStripChars = " ,.-:;";

// Heads too generic to name a part
const std::unordered_set<std::string> kExcludedChunkRoots = {
    "it", "access", "extent", "width", "ends", "structure", "point", "form",
    "define", "has", "portion", "side", "area", "view", "figure"
};

const std::unordered_set<std::string> kExcludedTokens = {
    "it", "access", "extent", "width", "ends", "structure", "point", "form",
    "define", "has", "portion", "view", "figure"
};

const std::regex& figureRegex() {
    static const std::regex re("\\bfigs?\\.?\\s*\\d+\\w*\\b", std::regex::icase);
    return re;
}

std::string escapeRegex(const std::string& word) {
    static const std::string kSpecial = "\\^$.|?*+()[]{}";
    std::string out;
    for (char c : word) {
        if (kSpecial.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string toLowerAscii(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trimChars(const std::string& s, const char* chars) {
    size_t begin = s.find_first_not_of(chars);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(chars);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

bool isNominal(PosTag tag) {
    return tag == PosTag::NOUN || tag == PosTag::PROPN;
}

} // namespace

PhraseNormalizer::PhraseNormalizer(std::shared_ptr<const LanguageModel> model,
                                   const std::vector<std::string>& extraStopwords)
    : model_(std::move(model)) {
    std::string alternation = kStopwordPattern;
    for (const auto& word : extraStopwords) {
        if (!word.empty()) {
            alternation += "|" + escapeRegex(toLowerAscii(word));
        }
    }
    stopwords_ = std::regex("\\b(?:" + alternation + ")\\b", std::regex::icase);

    if (!model_) {
        LOG_WARN("PhraseNormalizer created without a language model");
    }
}

bool PhraseNormalizer::containsFigureReference(const std::string& phrase) {
    return std::regex_search(phrase, figureRegex());
}

bool PhraseNormalizer::endsWithFigureToken(const std::string& phrase) {
    std::vector<std::string> words = splitWords(toLowerAscii(phrase));
    if (words.empty()) {
        return false;
    }
    std::string last = trimChars(words.back(), kStripChars);
    return last == "fig" || last == "figs";
}

std::string PhraseNormalizer::clean(const std::string& phrase) const {
    std::string text = toLowerAscii(phrase);
    text = std::regex_replace(text, stopwords_, "");
    text = std::regex_replace(text, figureRegex(), "");
    text = joinWords(splitWords(text));
    return trimChars(text, kStripChars);
}

std::string PhraseNormalizer::selectHeadPhrase(const std::string& cleaned) const {
    std::vector<Token> tokens = model_->tag(cleaned);
    std::vector<NounChunk> chunks = model_->nounChunks(tokens);

    for (auto it = chunks.rbegin(); it != chunks.rend(); ++it) {
        const Token& root = tokens[it->root];
        if (!isNominal(root.pos) || kExcludedChunkRoots.count(root.lower) > 0) {
            continue;
        }
        std::string text = LanguageModel::chunkText(cleaned, tokens, *it);
        if (text.size() > 1) {
            return text;
        }
    }

    for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
        if (isNominal(it->pos) && it->text.size() > 1 && kExcludedTokens.count(it->lower) == 0) {
            return it->text;
        }
    }

    return "";
}

std::string PhraseNormalizer::reduceHeadPhrase(const std::string& head) const {
    std::vector<std::string> kept;
    for (const auto& token : model_->tag(head)) {
        if (isNominal(token.pos)) {
            auto singular = model_->singularNoun(token.lower);
            kept.push_back(singular ? *singular : token.text);
        } else if (token.pos == PosTag::ADJ) {
            kept.push_back(token.text);
        }
    }

    std::vector<std::string> collapsed;
    for (const auto& word : kept) {
        if (collapsed.empty() || collapsed.back() != word) {
            collapsed.push_back(word);
        }
    }
    return joinWords(collapsed);
}

std::string PhraseNormalizer::normalize(const std::string& phrase) const {
    if (!model_) {
        return trimChars(toLowerAscii(phrase), " \t\r\n");
    }

    std::string cleaned = clean(phrase);
    if (cleaned.empty()) {
        return "";
    }

    std::string head = selectHeadPhrase(cleaned);
    if (head.empty()) {
        LOG_TRACE("No head phrase in '{}'", cleaned);
        return "";
    }

    std::string label = reduceHeadPhrase(head);
    if (label.size() <= 1) {
        return "";
    }

    LOG_TRACE("Normalized '{}' -> '{}'", phrase, label);
    return label;
}

} // namespace refnum
