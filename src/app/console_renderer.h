#pragma once

// ==============================================================================
// ConsoleRenderer - Text Output Renderer
// ==============================================================================
// Prints one line per analysis result and one per status message to an
// injected stream. Calls are already serialized by the orchestrator.
// ==============================================================================

#include "pipeline/renderer.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace Notescope {

/// Waveform level of one published snapshot
struct LevelSummary {
    float peak = 0.0f;   ///< Largest absolute sample
    float rms = 0.0f;
};

[[nodiscard]] LevelSummary computeLevels(const std::vector<float>& waveform) noexcept;

class ConsoleRenderer final : public Renderer {
public:
    static constexpr size_t kDefaultPeaksShown = 5;

    explicit ConsoleRenderer(std::ostream& out, size_t peaksShown = kDefaultPeaksShown)
        : out_(out), peaksShown_(peaksShown) {}

    void onResult(const PipelineResult& result) override;
    void onCleared() override;
    void onStatus(const std::string& text) override;

    /// Format used by onResult(), without the trailing newline
    [[nodiscard]] std::string formatResult(const PipelineResult& result) const;

private:
    std::ostream& out_;
    size_t peaksShown_;
};

} // namespace Notescope
