#include "core/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <algorithm>
#include <vector>

namespace deaddrop {

std::shared_ptr<spdlog::logger> Log::s_coreLogger;
std::shared_ptr<spdlog::logger> Log::s_hostLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Replace any loggers from a previous init (or lazy default creation)
    spdlog::drop("DROP");
    spdlog::drop("HOST");

    s_coreLogger = std::make_shared<spdlog::logger>("DROP", sinks.begin(), sinks.end());
    s_hostLogger = std::make_shared<spdlog::logger>("HOST", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_coreLogger->set_level(spdLevel);
    s_hostLogger->set_level(spdLevel);

    spdlog::register_logger(s_coreLogger);
    spdlog::register_logger(s_hostLogger);
}

void Log::shutdown() {
    spdlog::shutdown();
    s_coreLogger.reset();
    s_hostLogger.reset();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

void Log::attachSink(const spdlog::sink_ptr& sink) {
    getCoreLogger()->sinks().push_back(sink);
    getHostLogger()->sinks().push_back(sink);
}

void Log::detachSink(const spdlog::sink_ptr& sink) {
    for (auto* logger : {&s_coreLogger, &s_hostLogger}) {
        if (!*logger) continue;
        auto& sinks = (*logger)->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    }
}

std::shared_ptr<spdlog::logger>& Log::getCoreLogger() {
    if (!s_coreLogger) {
        init();
    }
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger>& Log::getHostLogger() {
    if (!s_hostLogger) {
        init();
    }
    return s_hostLogger;
}

} // namespace deaddrop
