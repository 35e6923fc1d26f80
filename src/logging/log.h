#pragma once

// ==============================================================================
// Log - Application Logger
// ==============================================================================
// A single spdlog logger named "notescope" writing colourised lines to stderr.
// Log::get() creates it on first use when the application never called
// initialize() (unit tests).
//
// Never call into the logger from the audio capture callback.
// ==============================================================================

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace Notescope {

class Log {
public:
    static constexpr const char* kLoggerName = "notescope";

    /// @brief Create (or reconfigure) the logger at the given level
    static void initialize(spdlog::level::level_enum level = spdlog::level::info);

    /// @brief The application logger; never null
    [[nodiscard]] static std::shared_ptr<spdlog::logger> get();

    /// @brief Parse trace|debug|info|warn|error|critical|off
    [[nodiscard]] static bool parseLevel(std::string_view text, spdlog::level::level_enum& out) noexcept;
};

} // namespace Notescope
