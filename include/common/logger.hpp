#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <cstddef>
#include <string>

/**
 * Logging system for RefNum
 *
 * All macros forward to the spdlog default logger, so they are usable before
 * InitLogger() is called (console output at info level).
 */

namespace refnum {

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    std::string name = "refnum";
    std::string level = "info";          // trace / debug / info / warn / error / off
    bool logToFile = false;              // enable rotating file sink
    std::string logDir = "logs";
    std::string fileName = "refnum.log";
    size_t maxFileSize = 10 * 1024 * 1024;
    size_t maxFiles = 3;
};

/**
 * @brief Install the process logger (console sink + optional rotating file sink)
 * @throws spdlog::spdlog_ex when a sink cannot be created
 */
void InitLogger(const LoggerConfig& config);

} // namespace refnum

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

// Run a block only when debug output is enabled (expensive dumps)
#define LOG_DEBUG_EXEC(...) \
    do { \
        if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) { \
            (__VA_ARGS__)(); \
        } \
    } while (0)
