// ==============================================================================
// Command Line Parsing Implementation
// ==============================================================================

#include "app/command_line.h"

#include "logging/log.h"
#include "version.h"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace Notescope {

namespace {

Status badValue(const std::string& flag, const std::string& value) {
    return Status::failure(ErrorCode::Configuration,
                           "invalid value '" + value + "' for " + flag);
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool parseInteger(const std::string& text, long long& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) return false;
    out = value;
    return true;
}

bool parseCount(const std::string& text, size_t& out) {
    long long value = 0;
    if (!parseInteger(text, value) || value < 0) return false;
    out = static_cast<size_t>(value);
    return true;
}

} // namespace

Status parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options) {
    PipelineConfig& config = options.pipeline;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inlineValue;
        if (const auto eq = flag.find('='); flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = flag.substr(eq + 1);
            flag.resize(eq);
        }

        // Switches
        if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
            continue;
        }
        if (flag == "--list-devices") {
            options.listDevices = true;
            continue;
        }
        if (flag == "--autostart") {
            options.autostart = true;
            continue;
        }
        if (flag == "--downmix") {
            config.downmix = true;
            continue;
        }

        // Options taking a value
        std::string value;
        if (inlineValue) {
            value = *inlineValue;
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else if (flag.rfind("--", 0) == 0) {
            return Status::failure(ErrorCode::Configuration, "missing value for " + flag);
        }

        double number = 0.0;
        long long integer = 0;
        if (flag == "--sample-rate") {
            if (!parseDouble(value, number)) return badValue(flag, value);
            config.sampleRate = number;
        } else if (flag == "--block-size") {
            if (!parseCount(value, config.blockSize)) return badValue(flag, value);
        } else if (flag == "--buffer-duration") {
            if (!parseDouble(value, number)) return badValue(flag, value);
            config.bufferDurationSeconds = number;
        } else if (flag == "--tick-interval") {
            if (!parseInteger(value, integer)) return badValue(flag, value);
            config.tickInterval = std::chrono::milliseconds(integer);
        } else if (flag == "--min-freq") {
            if (!parseDouble(value, number)) return badValue(flag, value);
            config.minFrequencyHz = static_cast<float>(number);
        } else if (flag == "--top-k") {
            if (!parseCount(value, config.topK)) return badValue(flag, value);
        } else if (flag == "--peak-separation") {
            if (!parseCount(value, config.peakMinSeparationBins)) return badValue(flag, value);
        } else if (flag == "--peak-height") {
            if (!parseDouble(value, number)) return badValue(flag, value);
            config.peakHeightFraction = static_cast<float>(number);
        } else if (flag == "--channels") {
            if (!parseInteger(value, integer) || integer < 1 || integer > 64) return badValue(flag, value);
            config.channelCount = static_cast<int>(integer);
        } else if (flag == "--input-channel") {
            if (!parseInteger(value, integer) || integer < 0 || integer > 63) return badValue(flag, value);
            config.inputChannel = static_cast<int>(integer);
        } else if (flag == "--device") {
            config.deviceName = value;
        } else if (flag == "--window") {
            if (!parseWindowType(value, config.window)) return badValue(flag, value);
        } else if (flag == "--log-level") {
            if (!Log::parseLevel(value, options.logLevel)) return badValue(flag, value);
        } else {
            return Status::failure(ErrorCode::Configuration, "unknown option " + args[i]);
        }
    }

    if (options.showHelp) return Status::success();
    return config.validate();
}

Status parseCommandLine(int argc, const char* const* argv, CommandLineOptions& options) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args, options);
}

std::string usageText() {
    return "Usage: " NOTESCOPE_PROGRAM_NAME " [options]\n"
           NOTESCOPE_DESCRIPTION " (version " NOTESCOPE_VERSION_STR ")\n"
           "\n"
           "Capture:\n"
           "  --device NAME            input device (default: system default input)\n"
           "  --sample-rate HZ         sample rate (44100)\n"
           "  --block-size FRAMES      frames per driver callback (2048)\n"
           "  --channels N             channels to open (1)\n"
           "  --input-channel N        channel to analyze (0)\n"
           "  --downmix                average all channels instead\n"
           "  --buffer-duration SEC    analysis buffer length (5.0)\n"
           "\n"
           "Analysis:\n"
           "  --tick-interval MS       analysis interval (100)\n"
           "  --window NAME            hann | hamming | blackman (hann)\n"
           "  --min-freq HZ            discard bins below this frequency (20)\n"
           "  --top-k N                peaks reported per tick (10)\n"
           "  --peak-separation BINS   minimum distance between peaks (10)\n"
           "  --peak-height FRACTION   threshold between 5th percentile and max (0.2)\n"
           "\n"
           "Application:\n"
           "  --list-devices           print input devices and exit\n"
           "  --autostart              start capturing immediately\n"
           "  --log-level LEVEL        trace | debug | info | warn | error | critical | off\n"
           "  --help                   show this text\n"
           "\n"
           "Commands (stdin): start, stop, clear, devices, status, help, quit\n";
}

} // namespace Notescope
