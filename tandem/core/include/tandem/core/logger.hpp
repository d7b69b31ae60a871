/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 *
 * One shared logger for the library. Embedding applications either call
 * initLogging()/initFileLogging() at startup or get a console logger
 * lazily on first use.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tandem {

/// Initialize console logging (call once at startup)
void initLogging(const std::string& appName, spdlog::level::level_enum level = spdlog::level::info);

/// Initialize console + rotating file logging (10 MB x 3 files)
void initFileLogging(const std::string& appName,
                     const std::string& logFile,
                     spdlog::level::level_enum level = spdlog::level::info);

/// Get default logger
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

} // namespace tandem

#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(tandem::getLogger(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(tandem::getLogger(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(tandem::getLogger(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(tandem::getLogger(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(tandem::getLogger(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(tandem::getLogger(), __VA_ARGS__)
