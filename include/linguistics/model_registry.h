#pragma once

#include "linguistics/language_model.h"
#include <memory>
#include <string>

namespace refnum {

/**
 * @brief Process-wide language model, loaded once on first use
 *
 * Later calls return the same instance whatever path they pass. A failed load
 * is remembered, so callers fall back to lower-case normalization without
 * retrying the file on every request.
 *
 * @param path Model file used by the first call
 * @return Shared model, or nullptr if the first load failed
 */
std::shared_ptr<const LanguageModel> SharedLanguageModel(const std::string& path);

} // namespace refnum
