#include "Log.hpp"

HB_DISABLE_WARNINGS_PUSH
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
HB_DISABLE_WARNINGS_POP

#include <vector>

namespace h5bind {

// Static member definition
std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::Init(const char* logFilePath, Level level) {
    // Console goes to stderr so stdout stays clean for --runtime-info output
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (logFilePath && logFilePath[0] != '\0') {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-initialization replaces the previous sinks
    if (s_Logger) {
        s_Logger->flush();
        spdlog::drop(s_Logger->name());
    }

    s_Logger = std::make_shared<spdlog::logger>("H5Bind", sinks.begin(), sinks.end());
    s_Logger->set_level(spdlog::level::trace); // Capture all levels, filter below
    s_Logger->flush_on(spdlog::level::err);    // Auto-flush on errors

    spdlog::register_logger(s_Logger);
    spdlog::set_default_logger(s_Logger);

    SetLevel(level);

    Debug("H5Bind logger initialized");
    Debug("Platform: {}, Compiler: {}, Config: {}",
          GetPlatformName(), GetCompilerName(), GetBuildConfig());
}

void Log::Shutdown() {
    if (s_Logger) {
        s_Logger->flush();
        spdlog::shutdown();
        s_Logger.reset();
    }
}

void Log::SetLevel(Level level) {
    if (!s_Logger) return;

    switch (level) {
        case Level::Trace:    s_Logger->set_level(spdlog::level::trace); break;
        case Level::Debug:    s_Logger->set_level(spdlog::level::debug); break;
        case Level::Info:     s_Logger->set_level(spdlog::level::info); break;
        case Level::Warn:     s_Logger->set_level(spdlog::level::warn); break;
        case Level::Error:    s_Logger->set_level(spdlog::level::err); break;
        case Level::Critical: s_Logger->set_level(spdlog::level::critical); break;
        case Level::Off:      s_Logger->set_level(spdlog::level::off); break;
    }
}

Log::Level Log::GetLevel() {
    if (!s_Logger) return Level::Off;

    switch (s_Logger->level()) {
        case spdlog::level::trace:    return Level::Trace;
        case spdlog::level::debug:    return Level::Debug;
        case spdlog::level::info:     return Level::Info;
        case spdlog::level::warn:     return Level::Warn;
        case spdlog::level::err:      return Level::Error;
        case spdlog::level::critical: return Level::Critical;
        default:                      return Level::Off;
    }
}

Optional<Log::Level> Log::ParseLevel(StringView name) {
    if (name == "trace")    return Level::Trace;
    if (name == "debug")    return Level::Debug;
    if (name == "info")     return Level::Info;
    if (name == "warn")     return Level::Warn;
    if (name == "error")    return Level::Error;
    if (name == "critical") return Level::Critical;
    if (name == "off")      return Level::Off;
    return std::nullopt;
}

void Log::Flush() {
    if (s_Logger) {
        s_Logger->flush();
    }
}

} // namespace h5bind
