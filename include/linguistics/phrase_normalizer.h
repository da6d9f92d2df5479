#pragma once

#include "linguistics/language_model.h"
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace refnum {

/**
 * @brief Reduces a raw descriptive phrase to a short canonical label
 *
 * "a flexible main body" -> "flexible main body",
 * "rigid insulated compartments" -> "rigid insulated compartment".
 *
 * Thread-safe: all state is built in the constructor and read-only afterwards.
 */
class PhraseNormalizer {
public:
    /**
     * @param model Tagger/chunker; nullptr degrades normalize() to lower-case + trim
     * @param extraStopwords Whole words removed in addition to the built-in list
     */
    explicit PhraseNormalizer(std::shared_ptr<const LanguageModel> model,
                              const std::vector<std::string>& extraStopwords = {});

    /**
     * @brief Canonical label of a phrase
     * @return Empty string if no usable label remains
     */
    std::string normalize(const std::string& phrase) const;

    bool hasModel() const { return model_ != nullptr; }

    /**
     * @brief True if the phrase contains a "FIG. 3" / "figs 4A" style token
     */
    static bool containsFigureReference(const std::string& phrase);

    /**
     * @brief True if the last word of the phrase is a bare "fig" or "figs"
     */
    static bool endsWithFigureToken(const std::string& phrase);

private:
    std::string clean(const std::string& phrase) const;
    std::string selectHeadPhrase(const std::string& cleaned) const;
    std::string reduceHeadPhrase(const std::string& head) const;

    std::shared_ptr<const LanguageModel> model_;
    std::regex stopwords_;
};

} // namespace refnum
