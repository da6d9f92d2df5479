#include "linguistics/language_model.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace refnum {

namespace {

struct PosTagEntry {
    PosTag tag;
    const char* name;
};

const PosTagEntry kPosTags[] = {
    {PosTag::NOUN, "NOUN"},   {PosTag::PROPN, "PROPN"}, {PosTag::ADJ, "ADJ"},
    {PosTag::VERB, "VERB"},   {PosTag::AUX, "AUX"},     {PosTag::ADV, "ADV"},
    {PosTag::ADP, "ADP"},     {PosTag::DET, "DET"},     {PosTag::PRON, "PRON"},
    {PosTag::CCONJ, "CCONJ"}, {PosTag::SCONJ, "SCONJ"}, {PosTag::PART, "PART"},
    {PosTag::NUM, "NUM"},     {PosTag::PUNCT, "PUNCT"}, {PosTag::X, "X"},
};

// Non-ASCII bytes are treated as letters so UTF-8 words stay whole
bool isWordChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return uc >= 0x80 || std::isalnum(uc) || c == '_';
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLowerAscii(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isNominal(PosTag tag) {
    return tag == PosTag::NOUN || tag == PosTag::PROPN;
}

bool isModifierOrNominal(PosTag tag) {
    return tag == PosTag::ADJ || isNominal(tag);
}

bool isParticiple(const Token& token) {
    return token.pos == PosTag::VERB &&
           (endsWith(token.lower, "ed") || endsWith(token.lower, "ing"));
}

} // namespace

const char* PosTagName(PosTag tag) {
    for (const auto& entry : kPosTags) {
        if (entry.tag == tag) {
            return entry.name;
        }
    }
    return "X";
}

bool ParsePosTag(const std::string& name, PosTag& tag) {
    for (const auto& entry : kPosTags) {
        if (name == entry.name) {
            tag = entry.tag;
            return true;
        }
    }
    return false;
}

// ==================== Loading ====================

std::shared_ptr<const LanguageModel> LanguageModel::LoadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open language model: {}", path);
        return nullptr;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse language model {}: {}", path, e.what());
        return nullptr;
    }

    auto model = FromJson(j);
    if (model) {
        LOG_INFO("Loaded language model '{}' from {} ({} lexicon entries)",
                 model->name(), path, model->lexiconSize());
    }
    return model;
}

std::shared_ptr<const LanguageModel> LanguageModel::FromJson(const json& j) {
    std::shared_ptr<LanguageModel> model(new LanguageModel());

    try {
        if (!j.is_object() || !j.contains("lexicon") || !j["lexicon"].is_object()) {
            LOG_ERROR("Language model must be an object with a 'lexicon' object");
            return nullptr;
        }

        model->name_ = j.value("name", std::string("unnamed"));

        for (auto it = j["lexicon"].begin(); it != j["lexicon"].end(); ++it) {
            PosTag tag;
            if (!ParsePosTag(it.key(), tag)) {
                LOG_ERROR("Unknown part-of-speech '{}' in lexicon", it.key());
                return nullptr;
            }
            for (const auto& word : it.value()) {
                // Keys iterate sorted, so a word listed twice keeps the later class
                model->lexicon_[toLowerAscii(word.get<std::string>())] = tag;
            }
        }

        if (j.contains("suffixes")) {
            for (const auto& rule : j["suffixes"]) {
                PosTag tag;
                std::string pos = rule.at("pos").get<std::string>();
                if (!ParsePosTag(pos, tag)) {
                    LOG_ERROR("Unknown part-of-speech '{}' in suffix rules", pos);
                    return nullptr;
                }
                std::string suffix = toLowerAscii(rule.at("suffix").get<std::string>());
                if (suffix.empty()) {
                    LOG_ERROR("Empty suffix in suffix rules");
                    return nullptr;
                }
                model->suffixes_.emplace_back(suffix, tag);
            }
        }

        if (j.contains("irregularPlurals")) {
            for (auto it = j["irregularPlurals"].begin(); it != j["irregularPlurals"].end(); ++it) {
                model->irregularPlurals_[toLowerAscii(it.key())] =
                    toLowerAscii(it.value().get<std::string>());
            }
        }

        if (j.contains("invariantNouns")) {
            for (const auto& word : j["invariantNouns"]) {
                model->invariantNouns_.insert(toLowerAscii(word.get<std::string>()));
            }
        }
    } catch (const json::exception& e) {
        LOG_ERROR("Malformed language model: {}", e.what());
        return nullptr;
    }

    return model;
}

// ==================== Tagging ====================

std::vector<Token> LanguageModel::tokenize(const std::string& text) const {
    std::vector<Token> tokens;
    size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c)) {
            i++;
            continue;
        }

        Token token;
        token.begin = i;
        if (isWordChar(text[i])) {
            i++;
            // Internal hyphens and apostrophes join: "non-insulated", "user's"
            while (i < n) {
                if (isWordChar(text[i])) {
                    i++;
                } else if ((text[i] == '-' || text[i] == '\'') && i + 1 < n && isWordChar(text[i + 1])) {
                    i++;
                } else {
                    break;
                }
            }
        } else {
            i++;
            token.pos = PosTag::PUNCT;
        }
        token.end = i;
        token.text = text.substr(token.begin, token.end - token.begin);
        token.lower = toLowerAscii(token.text);
        tokens.push_back(std::move(token));
    }

    return tokens;
}

void LanguageModel::lookup(Token& token) const {
    if (token.pos == PosTag::PUNCT) {
        return;
    }

    if (std::all_of(token.lower.begin(), token.lower.end(),
                    [](unsigned char c) { return std::isdigit(c); })) {
        token.pos = PosTag::NUM;
        return;
    }

    auto it = lexicon_.find(token.lower);
    if (it != lexicon_.end()) {
        token.pos = it->second;
        return;
    }

    // Hyphenated compounds take the class of their last segment
    std::string head = token.lower;
    size_t hyphen = head.rfind('-');
    if (hyphen != std::string::npos) {
        head = head.substr(hyphen + 1);
        it = lexicon_.find(head);
        if (it != lexicon_.end()) {
            token.pos = it->second;
            return;
        }
    }

    token.guessed = true;
    for (const auto& rule : suffixes_) {
        if (head.size() > rule.first.size() + 2 && endsWith(head, rule.first)) {
            token.pos = rule.second;
            return;
        }
    }

    token.pos = PosTag::NOUN;
}

void LanguageModel::applyContextRules(std::vector<Token>& tokens, bool mixedCase) const {
    size_t n = tokens.size();

    // Right to left so each token sees the final class of its successor
    for (size_t k = n; k-- > 0;) {
        Token& token = tokens[k];
        PosTag next = k + 1 < n ? tokens[k + 1].pos : PosTag::X;
        PosTag prev = k > 0 ? tokens[k - 1].pos : PosTag::X;

        if (isParticiple(token)) {
            if (isModifierOrNominal(next)) {
                token.pos = PosTag::ADJ;            // "insulated compartment"
            } else if (token.guessed && endsWith(token.lower, "ing") &&
                       (prev == PosTag::DET || prev == PosTag::ADJ)) {
                token.pos = PosTag::NOUN;           // "the stitching"
            }
            continue;
        }

        if (token.pos == PosTag::ADJ && token.guessed && !isModifierOrNominal(next) &&
            prev != PosTag::AUX && prev != PosTag::VERB && prev != PosTag::ADV) {
            token.pos = PosTag::NOUN;               // "a metal", "the terminal"
        }
    }

    if (!mixedCase) {
        return;
    }

    for (size_t k = 1; k < n; k++) {
        Token& token = tokens[k];
        const Token& prev = tokens[k - 1];
        bool sentenceStart = prev.pos == PosTag::PUNCT &&
                             (prev.text == "." || prev.text == "!" || prev.text == "?");
        if (token.guessed && !sentenceStart &&
            std::isupper(static_cast<unsigned char>(token.text[0]))) {
            token.pos = PosTag::PROPN;
        }
    }
}

std::vector<Token> LanguageModel::tag(const std::string& text) const {
    std::vector<Token> tokens = tokenize(text);
    for (auto& token : tokens) {
        lookup(token);
    }

    bool hasUpper = std::any_of(text.begin(), text.end(),
                                [](unsigned char c) { return std::isupper(c); });
    bool hasLower = std::any_of(text.begin(), text.end(),
                                [](unsigned char c) { return std::islower(c); });
    applyContextRules(tokens, hasUpper && hasLower);

    LOG_DEBUG_EXEC([&]() {
        std::string trace;
        for (const auto& token : tokens) {
            trace += token.text + "/" + PosTagName(token.pos) + " ";
        }
        LOG_DEBUG("Tagged: {}", trace);
    });

    return tokens;
}

// ==================== Chunking ====================

std::vector<NounChunk> LanguageModel::nounChunks(const std::vector<Token>& tokens) const {
    std::vector<NounChunk> chunks;
    size_t n = tokens.size();
    size_t i = 0;

    while (i < n) {
        PosTag pos = tokens[i].pos;

        if (pos == PosTag::PRON) {
            chunks.push_back({i, i + 1, i});
            i++;
            continue;
        }

        if (pos != PosTag::DET && pos != PosTag::ADJ && pos != PosTag::NUM && !isNominal(pos)) {
            i++;
            continue;
        }

        // DET? (ADJ|NUM|NOUN)* NOUN+ : once a noun is seen only nouns extend it
        size_t start = i;
        size_t j = i;
        bool haveNoun = false;
        size_t lastNoun = 0;
        while (j < n) {
            PosTag p = tokens[j].pos;
            if (p == PosTag::DET && j != start) break;
            if (p != PosTag::DET && p != PosTag::ADJ && p != PosTag::NUM && !isNominal(p)) break;
            if (haveNoun && !isNominal(p)) break;
            if (isNominal(p)) {
                haveNoun = true;
                lastNoun = j;
            }
            j++;
        }

        if (haveNoun) {
            chunks.push_back({start, lastNoun + 1, lastNoun});
            i = lastNoun + 1;
        } else {
            i = j > i ? j : i + 1;
        }
    }

    return chunks;
}

std::string LanguageModel::chunkText(const std::string& text,
                                     const std::vector<Token>& tokens,
                                     const NounChunk& chunk) {
    if (chunk.start >= chunk.end || chunk.end > tokens.size()) {
        return "";
    }
    size_t begin = tokens[chunk.start].begin;
    size_t end = tokens[chunk.end - 1].end;
    return text.substr(begin, end - begin);
}

// ==================== Singularizer ====================

std::optional<std::string> LanguageModel::singularNoun(const std::string& word) const {
    std::string lower = toLowerAscii(word);

    auto irregular = irregularPlurals_.find(lower);
    if (irregular != irregularPlurals_.end()) {
        return irregular->second;
    }

    if (invariantNouns_.count(lower) > 0) {
        return std::nullopt;
    }

    if (lower.size() <= 2) {
        return std::nullopt;
    }

    if (endsWith(lower, "ss") || endsWith(lower, "us") || endsWith(lower, "is")) {
        return std::nullopt;
    }

    if (endsWith(lower, "ies") && lower.size() > 4) {
        return lower.substr(0, lower.size() - 3) + "y";
    }

    static const char* const kEsEndings[] = {"ches", "shes", "sses", "xes", "zzes"};
    for (const char* ending : kEsEndings) {
        if (endsWith(lower, ending)) {
            return lower.substr(0, lower.size() - 2);
        }
    }

    if (endsWith(lower, "s")) {
        return lower.substr(0, lower.size() - 1);
    }

    return std::nullopt;
}

} // namespace refnum
