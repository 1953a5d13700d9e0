#include "WaveFieldEngine.h"
#include "WaveMath.h"
#include <juce_core/juce_core.h>
#include <algorithm>
#include <cmath>

namespace wavegrid {

WaveFieldEngine::WaveFieldEngine(const ParameterSet& params)
    : params_(params)
{
}

// ============================================================
// Per-frame state
// ============================================================
void WaveFieldEngine::update(int frameIndex, float waveSpeed)
{
    float frameRadians = WaveMath::radians((float)frameIndex);
    FrameState next;
    next.waveMultiplier = WaveMath::map(std::sin(frameRadians), -1.0f, 1.0f,
                                        params_.getWaveMultiplierMin(),
                                        params_.getWaveMultiplierMax());
    next.lastUpdateFrame = frameIndex;
    next.lastWaveSpeed = waveSpeed;
    frame_ = next;
}

void WaveFieldEngine::ensureUpdated(int frameIndex, float waveSpeed)
{
    if (autoUpdate_ && (frameIndex != frame_.lastUpdateFrame || waveSpeed != frame_.lastWaveSpeed))
        update(frameIndex, waveSpeed);
}

// ============================================================
// Amplitude
// ============================================================
float WaveFieldEngine::calculateAmplitude(int x, int y) const
{
    float aMin = params_.getWaveAmplitudeMin();
    float aMax = params_.getWaveAmplitudeMax();
    float t = std::tan(WaveMath::radians((float)(x + y)));

    float normalized;
    if (aMin == aMax) {
        // Degenerate range: mapping then normalizing reduces to this
        normalized = (t + 1.0f) * 0.5f;
    } else {
        float a = WaveMath::map(t, -1.0f, 1.0f, aMin, aMax);
        normalized = WaveMath::map(a, aMin, aMax, 0.0f, 1.0f);
    }
    return WaveMath::constrain(normalized, 0.0f, 1.0f);
}

// ============================================================
// Brightness
// ============================================================
float WaveFieldEngine::calculateColor(int frameIndex, int x, int y, float amplitude)
{
    ensureUpdated(frameIndex, params_.getWaveSpeed());

    float angleRad = WaveMath::radians(params_.getWaveAngle());
    float dx = std::cos(angleRad);
    float dy = std::sin(angleRad);
    float spatial = ((float)x * dx + (float)y * dy) * frame_.waveMultiplier;
    float input = (float)frameIndex * params_.getWaveSpeed() + spatial * amplitude;

    float bMin = params_.getBrightnessMin();
    float bMax = params_.getBrightnessMax();
    // tan is unbounded near its asymptotes: clamp, don't renormalize
    float value = WaveMath::map(std::tan(WaveMath::radians(input)), -1.0f, 1.0f, bMin, bMax);
    return WaveMath::constrain(value, bMin, bMax);
}

float WaveFieldEngine::calculateColorCustom(int frameIndex, int x, int y, float tilesX, float tilesY)
{
    if (strategy_) {
        float normalizedX = (float)x / std::max(1.0f, tilesX);
        float normalizedY = (float)y / std::max(1.0f, tilesY);
        float time = (float)frameIndex
                   / (float)(params_.getAnimationFPS() * params_.getAnimationDuration());
        return (*strategy_)(frameIndex, normalizedX, normalizedY, time, params_);
    }
    return calculateColor(frameIndex, x, y, calculateAmplitude(x, y));
}

// ============================================================
// Saturation / hue
// ============================================================
float WaveFieldEngine::calculateSaturation(int frameIndex, int x, int y, float tilesX, float tilesY)
{
    juce::ignoreUnused(tilesX, tilesY);
    float sMin = params_.getSaturationMin();
    float sMax = params_.getSaturationMax();
    if (sMin == sMax) return sMin;

    ensureUpdated(frameIndex, params_.getWaveSpeed());
    // 30 degree offset and different time/space scaling decorrelate from brightness
    float angleRad = WaveMath::radians(params_.getWaveAngle() + 30.0f);
    float dx = std::cos(angleRad);
    float dy = std::sin(angleRad);
    float input = (float)frameIndex * params_.getWaveSpeed() * 0.7f
                + ((float)x * dx + (float)y * dy) * frame_.waveMultiplier * 1.3f;
    float value = WaveMath::map(std::sin(WaveMath::radians(input)), -1.0f, 1.0f, sMin, sMax);
    return WaveMath::constrain(value, sMin, sMax);
}

float WaveFieldEngine::calculateHue(int frameIndex, int x, int y, float tilesX, float tilesY)
{
    juce::ignoreUnused(tilesX, tilesY);
    float hMin = params_.getHueMin();
    float hMax = params_.getHueMax();
    if (hMin == hMax) return hMin;

    ensureUpdated(frameIndex, params_.getWaveSpeed());
    // Slow sweep along the wave direction
    float angleRad = WaveMath::radians(params_.getWaveAngle());
    float dx = std::cos(angleRad);
    float dy = std::sin(angleRad);
    float input = (float)frameIndex * params_.getWaveSpeed() * 0.3f
                + ((float)x * dx + (float)y * dy) * frame_.waveMultiplier * 0.5f;
    float value = WaveMath::map(std::sin(WaveMath::radians(input)), -1.0f, 1.0f, hMin, hMax);
    return WaveMath::constrain(value, hMin, hMax);
}

// ============================================================
// Strategy
// ============================================================
void WaveFieldEngine::setCustomWaveFunction(std::optional<WaveStrategy> strategy)
{
    if (strategy && !strategy->valid()) {
        DBG("[engine] Ignoring strategy '" + juce::String(strategy->name) + "' without a function");
        strategy.reset();
    }
    strategy_ = std::move(strategy);
    DBG("[engine] Wave function: " + juce::String(strategy_ ? strategy_->name : "default"));
}

void WaveFieldEngine::reset()
{
    strategy_.reset();
}

} // namespace wavegrid
