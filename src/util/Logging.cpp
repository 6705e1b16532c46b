#include "Logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cctype>
#include <mutex>

namespace {

const char* LoggerName = "dataset-cutter";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_loggerMutex;

spdlog::level::level_enum parseLevel(const std::string& level) {
    std::string l = level;
    for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (l == "trace") return spdlog::level::trace;
    if (l == "debug") return spdlog::level::debug;
    if (l == "info") return spdlog::level::info;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error") return spdlog::level::err;
    if (l == "critical") return spdlog::level::critical;
    if (l == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace

std::shared_ptr<spdlog::logger> appLogger() {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (!g_logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        g_logger = std::make_shared<spdlog::logger>(LoggerName, sink);
        g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        g_logger->set_level(spdlog::level::info);
    }
    return g_logger;
}

void initLogging(const std::string& level, const std::string& logFile, const std::string& pattern) {
    std::lock_guard<std::mutex> lock(g_loggerMutex);

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_logger = std::make_shared<spdlog::logger>(LoggerName, sink);
    g_logger->set_pattern(pattern);
    g_logger->set_level(parseLevel(level));

    if (!logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
            fileSink->set_pattern(pattern);
            g_logger->sinks().push_back(fileSink);
        } catch (const spdlog::spdlog_ex& ex) {
            g_logger->warn("Cannot open log file {}: {}", logFile, ex.what());
        }
    }
}
