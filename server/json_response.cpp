#include "json_response.h"
#include "correlation/label_map_io.h"
#include <uuid/uuid.h>

namespace refnum_server {

std::string JsonResponseBuilder::GenerateUUID() {
    uuid_t uuid;
    uuid_generate(uuid);

    char uuid_str[37];
    uuid_unparse(uuid, uuid_str);

    return std::string(uuid_str);
}

json JsonResponseBuilder::BuildSuccessResponse(const refnum::NumeralLabelMap& labels,
                                               const refnum::CorrelationStats* stats) {
    json response;
    response["logId"] = GenerateUUID();
    response["errorCode"] = ErrorCode::SUCCESS;
    response["errorMsg"] = "Success";

    response["result"]["labels"] = refnum::LabelMapIO::ToJson(labels);
    response["result"]["numerals"] = ConvertLabelsToJson(labels);

    if (stats) {
        response["result"]["stats"] = stats->ToJson();
    }

    return response;
}

json JsonResponseBuilder::BuildErrorResponse(int error_code, const std::string& error_msg) {
    json response;
    response["logId"] = GenerateUUID();
    response["errorCode"] = error_code;
    response["errorMsg"] = error_msg;

    return response;
}

json JsonResponseBuilder::ConvertLabelsToJson(const refnum::NumeralLabelMap& labels) {
    json items = json::array();
    for (const auto& entry : refnum::LabelMapIO::SortedNumerically(labels)) {
        json item;
        item["numeral"] = entry.first;
        item["label"] = entry.second;
        items.push_back(item);
    }
    return items;
}

} // namespace refnum_server
