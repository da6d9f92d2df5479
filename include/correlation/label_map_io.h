#pragma once

#include "common/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace refnum {

using json = nlohmann::json;

/**
 * @brief Numeral -> label tables as JSON objects or "100: label" text
 *
 * Loading only accepts 1-4 digit keys and non-empty string labels.
 */
class LabelMapIO {
public:
    static json ToJson(const NumeralLabelMap& labels);
    static bool FromJson(const json& j, NumeralLabelMap& labels, std::string& error_msg);

    static bool SaveToJSON(const NumeralLabelMap& labels, const std::string& path);
    static bool LoadFromJSON(const std::string& path, NumeralLabelMap& labels, std::string& error_msg);

    /**
     * @brief One "numeral: label" line per entry, numeric order
     */
    static std::string ToKeyValueText(const NumeralLabelMap& labels);

    /**
     * @brief Parse "numeral: label" lines; blank lines and '#' comments are ignored
     */
    static bool FromKeyValueText(const std::string& text, NumeralLabelMap& labels, std::string& error_msg);

    static bool SaveToKeyValue(const NumeralLabelMap& labels, const std::string& path);
    static bool LoadFromKeyValue(const std::string& path, NumeralLabelMap& labels, std::string& error_msg);

    /**
     * @brief Entries ordered by numeric value ("7" before "10"), ties by text
     */
    static std::vector<std::pair<std::string, std::string>> SortedNumerically(const NumeralLabelMap& labels);
};

} // namespace refnum
