// ==============================================================================
// ConsoleRenderer Implementation
// ==============================================================================

#include "app/console_renderer.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace Notescope {

LevelSummary computeLevels(const std::vector<float>& waveform) noexcept {
    LevelSummary levels;
    if (waveform.empty()) return levels;

    double sumSquares = 0.0;
    float peak = 0.0f;
    for (const float s : waveform) {
        peak = std::max(peak, std::abs(s));
        sumSquares += static_cast<double>(s) * static_cast<double>(s);
    }
    levels.peak = peak;
    levels.rms = static_cast<float>(std::sqrt(sumSquares / static_cast<double>(waveform.size())));
    return levels;
}

std::string ConsoleRenderer::formatResult(const PipelineResult& result) const {
    const LevelSummary levels = computeLevels(result.waveform);

    std::string line = fmt::format("[tick {}] {:.2f}s peak {:.3f} rms {:.3f} |",
                                   result.sequence,
                                   result.sampleRate > 0.0
                                       ? static_cast<double>(result.waveform.size()) / result.sampleRate
                                       : 0.0,
                                   levels.peak, levels.rms);

    if (result.peaks.empty()) {
        line += " no peaks";
        return line;
    }

    const size_t count = std::min(peaksShown_, result.peaks.size());
    for (size_t i = 0; i < count; ++i) {
        const auto& peak = result.peaks[i];
        line += fmt::format("{} {:.1f} Hz ({:.1f} dB)", i == 0 ? "" : ",", peak.frequencyHz,
                            peak.magnitudeDb);
    }
    return line;
}

void ConsoleRenderer::onResult(const PipelineResult& result) {
    out_ << formatResult(result) << '\n';
    out_.flush();
}

void ConsoleRenderer::onCleared() {
    out_ << "[cleared]\n";
    out_.flush();
}

void ConsoleRenderer::onStatus(const std::string& text) {
    out_ << "> " << text << '\n';
    out_.flush();
}

} // namespace Notescope
