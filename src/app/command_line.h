#pragma once

// ==============================================================================
// Command Line Parsing
// ==============================================================================

#include "pipeline/error.h"
#include "pipeline/pipeline_config.h"

#include <spdlog/common.h>

#include <string>
#include <vector>

namespace Notescope {

struct CommandLineOptions {
    PipelineConfig pipeline;
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool listDevices = false;
    bool autostart = false;
    bool showHelp = false;
};

/// @brief Parse arguments (excluding the program name)
///
/// Accepts both "--flag value" and "--flag=value". The resulting pipeline
/// configuration is validated before returning.
/// @return ConfigurationError naming the offending flag
[[nodiscard]] Status parseCommandLine(const std::vector<std::string>& args,
                                      CommandLineOptions& options);

/// @brief Convenience overload for main()
[[nodiscard]] Status parseCommandLine(int argc, const char* const* argv,
                                      CommandLineOptions& options);

[[nodiscard]] std::string usageText();

} // namespace Notescope
