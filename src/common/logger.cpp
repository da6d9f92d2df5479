#include "common/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace refnum {

void InitLogger(const LoggerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.logToFile) {
        std::filesystem::create_directories(config.logDir);
        std::string path = config.logDir + "/" + config.fileName;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, config.maxFileSize, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    // [time] [level] [file:line] message
    logger->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#]%$ %v");
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

} // namespace refnum
