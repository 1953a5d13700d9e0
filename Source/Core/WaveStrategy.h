#pragma once

#include "../Model/ParameterSet.h"
#include "CoherentNoise.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wavegrid {

// ============================================================
// WaveStrategy: a named brightness function over the lattice
// x, y are normalized to [0, 1]; time is 0 at the start of the
// animation and 1 at its end. Returns brightness, nominally in
// [brightnessMin, brightnessMax] (user functions are not checked).
// ============================================================
struct WaveStrategy {
    using Function = std::function<float(int frameIndex, float x, float y,
                                         float time, const ParameterSet& params)>;

    std::string name;
    std::string description = "Custom wave function";
    Function evaluate;

    bool valid() const { return static_cast<bool>(evaluate); }

    float operator()(int frameIndex, float x, float y, float time,
                     const ParameterSet& params) const
    {
        return evaluate(frameIndex, x, y, time, params);
    }
};

// ============================================================
// Built-in wave types
// ============================================================
enum class WaveType { Sine, Tangent, Square, Triangle, Sawtooth, Noise };

inline WaveType waveTypeFromString(const std::string& s)
{
    if (s == "tangent")  return WaveType::Tangent;
    if (s == "square")   return WaveType::Square;
    if (s == "triangle") return WaveType::Triangle;
    if (s == "sawtooth") return WaveType::Sawtooth;
    if (s == "noise")    return WaveType::Noise;
    return WaveType::Sine;
}

inline std::string waveTypeToString(WaveType t)
{
    switch (t) {
        case WaveType::Tangent:  return "tangent";
        case WaveType::Square:   return "square";
        case WaveType::Triangle: return "triangle";
        case WaveType::Sawtooth: return "sawtooth";
        case WaveType::Noise:    return "noise";
        default:                 return "sine";
    }
}

namespace WavePresets {

    WaveStrategy sine();
    WaveStrategy tangent();
    WaveStrategy square();
    WaveStrategy triangle();
    WaveStrategy sawtooth();

    // Two-octave noise blend; the strategy shares ownership of the source
    WaveStrategy noise(std::shared_ptr<const CoherentNoise> source,
                       float scale = 3.0f, float speed = 0.8f);
    WaveStrategy noise(float scale = 3.0f, float speed = 0.8f, int64_t seed = 0);

    // Wraps a caller-supplied function
    WaveStrategy custom(std::string name, WaveStrategy::Function fn,
                        std::string description = "Custom wave function");

    WaveStrategy get(WaveType type);

    const std::vector<WaveType>& allTypes();

    // Phase shared by the mathematical presets
    float computePhase(int frameIndex, float x, float y, const ParameterSet& params);

} // namespace WavePresets
} // namespace wavegrid
