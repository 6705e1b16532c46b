#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

// Application logger (created on first use, stderr only until initLogging runs)
std::shared_ptr<spdlog::logger> appLogger();

// Rebuild the logger with the given level and an optional file sink
void initLogging(const std::string& level = "info",
                 const std::string& logFile = "",
                 const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

#define DC_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(appLogger(), __VA_ARGS__)
#define DC_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(appLogger(), __VA_ARGS__)
#define DC_LOG_INFO(...)     SPDLOG_LOGGER_INFO(appLogger(), __VA_ARGS__)
#define DC_LOG_WARN(...)     SPDLOG_LOGGER_WARN(appLogger(), __VA_ARGS__)
#define DC_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(appLogger(), __VA_ARGS__)
#define DC_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(appLogger(), __VA_ARGS__)
