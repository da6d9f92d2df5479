#pragma once

#include "common/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace refnum {

using json = nlohmann::json;

/**
 * @brief Detection lists from OCR output
 *
 * Accepted documents:
 *   - an array of records
 *   - {"results": [...]} as written by the OCR pipeline
 *   - {"result": {"ocrResults": [...]}} as returned by the OCR server
 *
 * Record fields (either name): "text" | "prunedResult", "confidence" | "score",
 * "box" | "points" with four [x, y] pairs or {"x", "y"} objects.
 */
class DetectionIO {
public:
    /**
     * @brief Parse one record
     * @return false (and error_msg set) if a field is missing or mistyped
     */
    static bool ParseRecord(const json& record, Detection& detection, std::string& error_msg);

    /**
     * @brief Parse a document; incomplete records are skipped with a warning
     * @param skipped Incremented once per skipped record (optional)
     * @return false if the document has none of the accepted shapes
     */
    static bool FromJson(const json& j, std::vector<Detection>& detections,
                         std::string& error_msg, size_t* skipped = nullptr);

    static bool LoadFromJSON(const std::string& path, std::vector<Detection>& detections,
                             std::string& error_msg);

    /**
     * @brief Array of {"text", "confidence", "box": [[x, y], ...]}
     */
    static json ToJson(const std::vector<Detection>& detections);
};

} // namespace refnum
