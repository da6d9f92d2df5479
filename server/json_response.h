#pragma once

#include "correlation/correlation_engine.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace refnum_server {

/**
 * @brief Builds the response envelopes of the correlation service
 *
 * Every response carries {"logId", "errorCode", "errorMsg"}; successful ones
 * add a "result" object.
 */
class JsonResponseBuilder {
public:
    /**
     * @brief Random UUID used as logId
     */
    static std::string GenerateUUID();

    /**
     * @brief Success envelope with labels, numerals and optional stats
     * @param labels numeral -> label mapping
     * @param stats Timing and counters, omitted when null
     */
    static json BuildSuccessResponse(const refnum::NumeralLabelMap& labels,
                                     const refnum::CorrelationStats* stats = nullptr);

    /**
     * @brief Error envelope
     */
    static json BuildErrorResponse(int error_code, const std::string& error_msg);

    /**
     * @brief [{"numeral", "label"}, ...] in numeric order
     */
    static json ConvertLabelsToJson(const refnum::NumeralLabelMap& labels);
};

/**
 * @brief errorCode values
 */
namespace ErrorCode {
    constexpr int SUCCESS = 0;
    constexpr int INVALID_PARAMETER = 400;
    constexpr int INTERNAL_ERROR = 500;
    constexpr int SERVICE_UNAVAILABLE = 503;
}

} // namespace refnum_server
