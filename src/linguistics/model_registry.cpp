#include "linguistics/model_registry.h"
#include "common/logger.hpp"
#include <mutex>

namespace refnum {

namespace {
std::once_flag g_modelOnce;
std::shared_ptr<const LanguageModel> g_model;
std::string g_modelPath;
} // namespace

std::shared_ptr<const LanguageModel> SharedLanguageModel(const std::string& path) {
    std::call_once(g_modelOnce, [&path]() {
        g_modelPath = path;
        g_model = LanguageModel::LoadFromFile(path);
        if (!g_model) {
            LOG_WARN("Language model unavailable, labels fall back to lower-cased phrases");
        }
    });

    if (path != g_modelPath) {
        LOG_DEBUG("Language model already loaded from {}, ignoring {}", g_modelPath, path);
    }
    return g_model;
}

} // namespace refnum
