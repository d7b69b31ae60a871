/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <tandem/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <iostream>
#include <mutex>

namespace tandem {

static std::shared_ptr<spdlog::logger> s_logger;
static std::mutex s_loggerMutex;

namespace {

void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    s_logger = std::move(logger);
}

} // namespace

void initLogging(const std::string& appName, spdlog::level::level_enum level) {
    std::lock_guard lock(s_loggerMutex);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);

    install(std::make_shared<spdlog::logger>(appName, console_sink), level);
}

void initFileLogging(const std::string& appName,
                     const std::string& logFile,
                     spdlog::level::level_enum level) {
    std::lock_guard lock(s_loggerMutex);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 1024 * 1024 * 10, 3);  // 10MB, 3 files
        file_sink->set_level(level);

        install(std::make_shared<spdlog::logger>(
                    appName, spdlog::sinks_init_list{console_sink, file_sink}),
                level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log file initialization failed: " << ex.what() << std::endl;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        install(std::make_shared<spdlog::logger>(appName, console_sink), level);
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    {
        std::lock_guard lock(s_loggerMutex);
        if (s_logger) {
            return s_logger;
        }
    }
    initLogging("tandem");
    std::lock_guard lock(s_loggerMutex);
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard lock(s_loggerMutex);
    if (s_logger) {
        s_logger->set_level(level);
    }
}

} // namespace tandem
