#pragma once

#include "../Model/ParameterSet.h"
#include "WaveStrategy.h"
#include <optional>

namespace wavegrid {

// ============================================================
// WaveFieldEngine: per-cell hue / saturation / brightness
//
// Brightness, saturation and hue share one phase construction
//   phase = time term + (x·dx + y·dy) · waveMultiplier
// but use different shaping (tan vs sin) and offsets so the
// three channels never move in lockstep.
//
// The engine reads the ParameterSet on every query and never
// copies it; the caller keeps it alive for the engine's lifetime.
// ============================================================
class WaveFieldEngine {
public:
    explicit WaveFieldEngine(const ParameterSet& params);

    // Recompute the per-frame wave multiplier (from frameIndex only)
    void update(int frameIndex, float waveSpeed);

    // With auto-update on (default), queries update lazily once per frame
    void setAutoUpdate(bool enabled) { autoUpdate_ = enabled; }
    bool isAutoUpdate() const { return autoUpdate_; }

    // Lattice-only amplitude in [0, 1]
    float calculateAmplitude(int x, int y) const;

    // Default tangent brightness, clamped to [brightnessMin, brightnessMax]
    float calculateColor(int frameIndex, int x, int y, float amplitude);

    // Installed strategy if any, otherwise calculateColor()
    float calculateColorCustom(int frameIndex, int x, int y, float tilesX, float tilesY);

    float calculateSaturation(int frameIndex, int x, int y, float tilesX, float tilesY);
    float calculateHue(int frameIndex, int x, int y, float tilesX, float tilesY);

    // Pass std::nullopt (or a strategy without a function) to restore the default
    void setCustomWaveFunction(std::optional<WaveStrategy> strategy);
    const std::optional<WaveStrategy>& getCustomWaveFunction() const { return strategy_; }
    bool hasCustomWaveFunction() const { return strategy_.has_value(); }

    void reset();

    float getWaveMultiplier() const { return frame_.waveMultiplier; }
    int getLastUpdateFrame() const  { return frame_.lastUpdateFrame; }

private:
    // Memo of the last update; rewritten as a whole by update()
    struct FrameState {
        float waveMultiplier = 0.0f;
        int lastUpdateFrame  = -1;
        float lastWaveSpeed  = -1.0f;
    };

    void ensureUpdated(int frameIndex, float waveSpeed);

    const ParameterSet& params_;
    std::optional<WaveStrategy> strategy_;
    FrameState frame_;
    bool autoUpdate_ = true;
};

} // namespace wavegrid
