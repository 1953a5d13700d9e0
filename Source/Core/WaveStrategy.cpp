#include "WaveStrategy.h"
#include "WaveMath.h"
#include <cmath>

namespace wavegrid {
namespace WavePresets {

float computePhase(int frameIndex, float x, float y, const ParameterSet& params)
{
    // Time term plus a diagonal sweep of three cycles across the grid
    return (float)frameIndex * params.getWaveSpeed() * 0.05f
         + x * WaveMath::twoPi * 3.0f
         + y * WaveMath::twoPi * 3.0f;
}

// ============================================================
// Mathematical presets
// ============================================================
WaveStrategy sine()
{
    return {"Sine", "Smooth sinusoidal oscillation",
        [](int frameIndex, float x, float y, float, const ParameterSet& p) {
            float phase = computePhase(frameIndex, x, y, p);
            return WaveMath::map(std::sin(phase), -1.0f, 1.0f,
                                 p.getBrightnessMin(), p.getBrightnessMax());
        }};
}

WaveStrategy tangent()
{
    return {"Tangent", "Sharp, angular tangent oscillation",
        [](int frameIndex, float x, float y, float, const ParameterSet& p) {
            float phase = computePhase(frameIndex, x, y, p);
            float raw = WaveMath::map(std::tan(phase), -1.0f, 1.0f,
                                      p.getBrightnessMin(), p.getBrightnessMax());
            return WaveMath::constrain(raw, p.getBrightnessMin(), p.getBrightnessMax());
        }};
}

WaveStrategy square()
{
    return {"Square", "Binary on/off square wave",
        [](int frameIndex, float x, float y, float, const ParameterSet& p) {
            float phase = computePhase(frameIndex, x, y, p);
            return std::sin(phase) >= 0.0f ? p.getBrightnessMax() : p.getBrightnessMin();
        }};
}

WaveStrategy triangle()
{
    return {"Triangle", "Linear ramp up then down",
        [](int frameIndex, float x, float y, float, const ParameterSet& p) {
            float phase = computePhase(frameIndex, x, y, p);
            float t = WaveMath::wrapUnit(phase / WaveMath::twoPi);
            float tri = t < 0.5f ? (4.0f * t - 1.0f) : (3.0f - 4.0f * t);  // -1 -> +1 -> -1
            return WaveMath::map(tri, -1.0f, 1.0f,
                                 p.getBrightnessMin(), p.getBrightnessMax());
        }};
}

WaveStrategy sawtooth()
{
    return {"Sawtooth", "Linear ramp with sharp drop",
        [](int frameIndex, float x, float y, float, const ParameterSet& p) {
            float phase = computePhase(frameIndex, x, y, p);
            float t = WaveMath::wrapUnit(phase / WaveMath::twoPi);
            return WaveMath::map(t, 0.0f, 1.0f,
                                 p.getBrightnessMin(), p.getBrightnessMax());
        }};
}

// ============================================================
// Noise
// ============================================================
WaveStrategy noise(std::shared_ptr<const CoherentNoise> source, float scale, float speed)
{
    if (!source)
        source = std::make_shared<const CoherentNoise>();

    return {"Noise", "Organic coherent noise patterns",
        [source, scale, speed](int frameIndex, float x, float y, float, const ParameterSet& p) {
            float nx = x * scale;
            float ny = y * scale;
            float nt = (float)frameIndex * 0.01f * speed;
            float n1 = source->sample(nx, ny, nt);
            float n2 = source->sample(nx * 2.5f + 100.0f, ny * 2.5f + 100.0f, nt * 1.5f);
            float n  = n1 * 0.7f + n2 * 0.3f;
            // Blended octaves rarely reach 0 or 1; stretch the visible band
            return WaveMath::map(n, 0.15f, 0.85f,
                                 p.getBrightnessMin(), p.getBrightnessMax());
        }};
}

WaveStrategy noise(float scale, float speed, int64_t seed)
{
    return noise(std::make_shared<const CoherentNoise>(seed), scale, speed);
}

WaveStrategy custom(std::string name, WaveStrategy::Function fn, std::string description)
{
    return {std::move(name), std::move(description), std::move(fn)};
}

// ============================================================
// Lookup
// ============================================================
WaveStrategy get(WaveType type)
{
    switch (type) {
        case WaveType::Tangent:  return tangent();
        case WaveType::Square:   return square();
        case WaveType::Triangle: return triangle();
        case WaveType::Sawtooth: return sawtooth();
        case WaveType::Noise:    return noise();
        default:                 return sine();
    }
}

const std::vector<WaveType>& allTypes()
{
    static const std::vector<WaveType> types = {
        WaveType::Sine, WaveType::Tangent, WaveType::Square,
        WaveType::Triangle, WaveType::Sawtooth, WaveType::Noise
    };
    return types;
}

} // namespace WavePresets
} // namespace wavegrid
