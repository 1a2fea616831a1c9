#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace deaddrop {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    /// Add a sink to both loggers. Creates the loggers with defaults if
    /// init() has not run yet.
    static void attachSink(const spdlog::sink_ptr& sink);
    static void detachSink(const spdlog::sink_ptr& sink);

    /// Map a level name (trace, debug, info, warn, error, critical) to the
    /// spdlog level. Unknown names map to info.
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger>& getCoreLogger();
    static std::shared_ptr<spdlog::logger>& getHostLogger();

private:
    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_hostLogger;
};

} // namespace deaddrop

// Core logging macros
#define LOG_TRACE(...)    ::deaddrop::Log::getCoreLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::deaddrop::Log::getCoreLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::deaddrop::Log::getCoreLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::deaddrop::Log::getCoreLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::deaddrop::Log::getCoreLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::deaddrop::Log::getCoreLogger()->critical(__VA_ARGS__)

// Host adapter logging macros
#define HOST_LOG_TRACE(...)    ::deaddrop::Log::getHostLogger()->trace(__VA_ARGS__)
#define HOST_LOG_DEBUG(...)    ::deaddrop::Log::getHostLogger()->debug(__VA_ARGS__)
#define HOST_LOG_INFO(...)     ::deaddrop::Log::getHostLogger()->info(__VA_ARGS__)
#define HOST_LOG_WARN(...)     ::deaddrop::Log::getHostLogger()->warn(__VA_ARGS__)
#define HOST_LOG_ERROR(...)    ::deaddrop::Log::getHostLogger()->error(__VA_ARGS__)
#define HOST_LOG_CRITICAL(...) ::deaddrop::Log::getHostLogger()->critical(__VA_ARGS__)
