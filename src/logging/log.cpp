// ==============================================================================
// Log Implementation
// ==============================================================================

#include "logging/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace Notescope {

namespace {

std::mutex gLogMutex;
std::shared_ptr<spdlog::logger> gLogger;

std::shared_ptr<spdlog::logger> createLocked(spdlog::level::level_enum level) {
    if (!gLogger) {
        gLogger = spdlog::get(Log::kLoggerName);
        if (!gLogger) {
            gLogger = spdlog::stderr_color_mt(Log::kLoggerName);
        }
        gLogger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    gLogger->set_level(level);
    return gLogger;
}

} // namespace

void Log::initialize(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    createLocked(level);
}

std::shared_ptr<spdlog::logger> Log::get() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogger) return gLogger;
    return createLocked(spdlog::level::info);
}

bool Log::parseLevel(std::string_view text, spdlog::level::level_enum& out) noexcept {
    if (text == "trace") {
        out = spdlog::level::trace;
    } else if (text == "debug") {
        out = spdlog::level::debug;
    } else if (text == "info") {
        out = spdlog::level::info;
    } else if (text == "warn" || text == "warning") {
        out = spdlog::level::warn;
    } else if (text == "error") {
        out = spdlog::level::err;
    } else if (text == "critical") {
        out = spdlog::level::critical;
    } else if (text == "off") {
        out = spdlog::level::off;
    } else {
        return false;
    }
    return true;
}

} // namespace Notescope
