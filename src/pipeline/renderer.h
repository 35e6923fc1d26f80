#pragma once

// ==============================================================================
// Renderer - Result Consumer Interface
// ==============================================================================
// The orchestrator serializes every call: onResult, onCleared and onStatus
// never overlap, and at most one result is delivered per tick.
// Calls arrive on the tick thread or on the thread issuing a command.
// ==============================================================================

#include "pipeline/pipeline_types.h"

#include <string>

namespace Notescope {

class Renderer {
public:
    virtual ~Renderer() = default;

    /// @brief A new analysis result (valid only for the duration of the call)
    virtual void onResult(const PipelineResult& result) = 0;

    /// @brief The sample buffer was cleared; show an empty result
    virtual void onCleared() = 0;

    /// @brief Short status text ("Recording...", "Top Peaks: ...")
    virtual void onStatus(const std::string& text) = 0;
};

} // namespace Notescope
