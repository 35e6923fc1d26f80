#pragma once

// ==============================================================================
// Error Reporting
// ==============================================================================
// Status values returned by the control surface and preparation calls.
// Nothing in the pipeline throws across a module boundary; failures travel as
// a Status carrying an ErrorCode and a human-readable message.
// ==============================================================================

#include <cstdint>
#include <string>
#include <utility>

namespace Notescope {

/// @brief Failure categories of the analysis pipeline
enum class ErrorCode : uint8_t {
    None = 0,
    Configuration,     ///< Invalid parameters; fatal at construction/preparation
    Device,            ///< Audio device missing, busy or format unsupported
    Scheduler,         ///< Tick timer could not be started
    InsufficientData   ///< Empty snapshot; the tick is skipped
};

/// @brief Stable name used in log lines and status text
[[nodiscard]] constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::Configuration: return "ConfigurationError";
        case ErrorCode::Device: return "DeviceError";
        case ErrorCode::Scheduler: return "SchedulerError";
        case ErrorCode::InsufficientData: return "InsufficientDataError";
    }
    return "UnknownError";
}

/// @brief Result of a fallible operation
class Status {
public:
    Status() = default;

    [[nodiscard]] static Status success() { return {}; }

    [[nodiscard]] static Status failure(ErrorCode code, std::string message) {
        return Status(code, std::move(message));
    }

    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::None; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// "DeviceError: input device not found: USB Mic", or "OK"
    [[nodiscard]] std::string toString() const {
        if (ok()) return "OK";
        return std::string(errorCodeName(code_)) + ": " + message_;
    }

private:
    Status(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ErrorCode code_ = ErrorCode::None;
    std::string message_;
};

} // namespace Notescope
