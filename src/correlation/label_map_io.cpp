#include "correlation/label_map_io.h"
#include "common/logger.hpp"
#include "extraction/pattern_extractor.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace refnum {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool checkEntry(const std::string& numeral, const std::string& label, std::string& error_msg) {
    if (!PatternExtractor::isReferenceNumeral(numeral)) {
        error_msg = "Invalid numeral '" + numeral + "' (expected 1-4 digits)";
        return false;
    }
    if (trim(label).empty()) {
        error_msg = "Empty label for numeral " + numeral;
        return false;
    }
    return true;
}

} // namespace

json LabelMapIO::ToJson(const NumeralLabelMap& labels) {
    json j = json::object();
    for (const auto& entry : labels) {
        j[entry.first] = entry.second;
    }
    return j;
}

bool LabelMapIO::FromJson(const json& j, NumeralLabelMap& labels, std::string& error_msg) {
    if (!j.is_object()) {
        error_msg = "Label map must be a JSON object";
        return false;
    }

    NumeralLabelMap parsed;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            error_msg = "Label for numeral " + it.key() + " must be a string";
            return false;
        }
        std::string label = it.value().get<std::string>();
        if (!checkEntry(it.key(), label, error_msg)) {
            return false;
        }
        parsed[it.key()] = label;
    }

    labels = std::move(parsed);
    return true;
}

bool LabelMapIO::SaveToJSON(const NumeralLabelMap& labels, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        LOG_ERROR("Failed to open file for writing: {}", path);
        return false;
    }

    ofs << ToJson(labels).dump(2) << "\n";
    LOG_INFO("Labels saved to: {}", path);
    return true;
}

bool LabelMapIO::LoadFromJSON(const std::string& path, NumeralLabelMap& labels, std::string& error_msg) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error_msg = "Cannot open label map: " + path;
        return false;
    }

    try {
        return FromJson(json::parse(ifs), labels, error_msg);
    } catch (const json::exception& e) {
        error_msg = std::string("Invalid label map JSON: ") + e.what();
        return false;
    }
}

std::string LabelMapIO::ToKeyValueText(const NumeralLabelMap& labels) {
    std::ostringstream oss;
    for (const auto& entry : SortedNumerically(labels)) {
        oss << entry.first << ": " << entry.second << "\n";
    }
    return oss.str();
}

bool LabelMapIO::FromKeyValueText(const std::string& text, NumeralLabelMap& labels, std::string& error_msg) {
    NumeralLabelMap parsed;
    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;

    while (std::getline(iss, line)) {
        lineNo++;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        size_t colon = content.find(':');
        if (colon == std::string::npos) {
            error_msg = "Line " + std::to_string(lineNo) + ": expected 'numeral: label'";
            return false;
        }

        std::string numeral = trim(content.substr(0, colon));
        std::string label = trim(content.substr(colon + 1));
        if (!checkEntry(numeral, label, error_msg)) {
            error_msg = "Line " + std::to_string(lineNo) + ": " + error_msg;
            return false;
        }
        if (parsed.count(numeral) > 0) {
            error_msg = "Line " + std::to_string(lineNo) + ": duplicate numeral " + numeral;
            return false;
        }
        parsed[numeral] = label;
    }

    labels = std::move(parsed);
    return true;
}

bool LabelMapIO::SaveToKeyValue(const NumeralLabelMap& labels, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        LOG_ERROR("Failed to open file for writing: {}", path);
        return false;
    }

    ofs << ToKeyValueText(labels);
    LOG_INFO("Labels saved to: {}", path);
    return true;
}

bool LabelMapIO::LoadFromKeyValue(const std::string& path, NumeralLabelMap& labels, std::string& error_msg) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error_msg = "Cannot open label map: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return FromKeyValueText(buffer.str(), labels, error_msg);
}

std::vector<std::pair<std::string, std::string>> LabelMapIO::SortedNumerically(const NumeralLabelMap& labels) {
    std::vector<std::pair<std::string, std::string>> entries(labels.begin(), labels.end());
    std::sort(entries.begin(), entries.end(),
              [](const std::pair<std::string, std::string>& a,
                 const std::pair<std::string, std::string>& b) {
                  // Keys that are not numerals sort after all numerals
                  bool aNum = PatternExtractor::isReferenceNumeral(a.first);
                  bool bNum = PatternExtractor::isReferenceNumeral(b.first);
                  if (aNum != bNum) return aNum;
                  if (aNum) {
                      int av = std::stoi(a.first);
                      int bv = std::stoi(b.first);
                      if (av != bv) return av < bv;
                  }
                  return a.first < b.first;
              });
    return entries;
}

} // namespace refnum
