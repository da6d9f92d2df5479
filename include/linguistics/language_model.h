#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace refnum {

using json = nlohmann::json;

/**
 * @brief Universal part-of-speech tags
 */
enum class PosTag {
    NOUN, PROPN, ADJ, VERB, AUX, ADV, ADP, DET, PRON,
    CCONJ, SCONJ, PART, NUM, PUNCT, X
};

const char* PosTagName(PosTag tag);
bool ParsePosTag(const std::string& name, PosTag& tag);

/**
 * @brief One tagged token
 */
struct Token {
    std::string text;          // as written
    std::string lower;         // ASCII lower-case form
    PosTag pos = PosTag::X;
    size_t begin = 0;          // byte span [begin, end) in the tagged text
    size_t end = 0;
    bool guessed = false;      // tag came from a suffix rule or the NOUN default
};

/**
 * @brief Base noun phrase: tokens [start, end), head at root
 */
struct NounChunk {
    size_t start = 0;
    size_t end = 0;
    size_t root = 0;
};

/**
 * @brief Lexicon-driven English tagger, chunker and singularizer
 *
 * Built once from a declarative JSON model file and immutable afterwards, so
 * a single instance can be shared by any number of threads.
 *
 * Model file layout:
 *   {
 *     "name": "...",
 *     "lexicon":          { "ADJ": ["rigid", ...], "VERB": [...], ... },
 *     "suffixes":         [ { "suffix": "ible", "pos": "ADJ" }, ... ],
 *     "irregularPlurals": { "feet": "foot", ... },
 *     "invariantNouns":   [ "series", ... ]
 *   }
 */
class LanguageModel {
public:
    /**
     * @brief Load a model file
     * @return nullptr if the file is missing or malformed (error is logged)
     */
    static std::shared_ptr<const LanguageModel> LoadFromFile(const std::string& path);

    /**
     * @brief Build a model from an already parsed document
     * @return nullptr if the document is malformed (error is logged)
     */
    static std::shared_ptr<const LanguageModel> FromJson(const json& j);

    /**
     * @brief Tokenize and tag
     */
    std::vector<Token> tag(const std::string& text) const;

    /**
     * @brief Base noun phrases of a tagged sequence, left to right
     */
    std::vector<NounChunk> nounChunks(const std::vector<Token>& tokens) const;

    /**
     * @brief Singular form of a plural noun
     * @return std::nullopt if the word is already singular
     */
    std::optional<std::string> singularNoun(const std::string& word) const;

    /**
     * @brief Source text covered by a chunk
     */
    static std::string chunkText(const std::string& text,
                                 const std::vector<Token>& tokens,
                                 const NounChunk& chunk);

    const std::string& name() const { return name_; }
    size_t lexiconSize() const { return lexicon_.size(); }

private:
    LanguageModel() = default;

    std::vector<Token> tokenize(const std::string& text) const;
    void lookup(Token& token) const;
    void applyContextRules(std::vector<Token>& tokens, bool mixedCase) const;

    std::string name_;
    std::unordered_map<std::string, PosTag> lexicon_;
    std::vector<std::pair<std::string, PosTag>> suffixes_;   // first match wins
    std::unordered_map<std::string, std::string> irregularPlurals_;
    std::unordered_set<std::string> invariantNouns_;
};

} // namespace refnum
