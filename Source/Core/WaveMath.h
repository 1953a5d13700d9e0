#pragma once

#include <juce_core/juce_core.h>
#include <cmath>

namespace wavegrid {

// ============================================================
// Scalar helpers shared by the engine, presets and trail buffer
// ============================================================
namespace WaveMath {

    inline constexpr float twoPi = juce::MathConstants<float>::twoPi;

    inline float radians(float degrees) { return juce::degreesToRadians(degrees); }

    // Linear remap from [srcMin, srcMax] into [dstMin, dstMax] (unclamped)
    inline float map(float v, float srcMin, float srcMax, float dstMin, float dstMax)
    {
        return juce::jmap(v, srcMin, srcMax, dstMin, dstMax);
    }

    // Processing-style constrain: checks lo first, no assertion on lo > hi
    inline float constrain(float v, float lo, float hi)
    {
        return v < lo ? lo : (v > hi ? hi : v);
    }

    // Fractional part folded into [0, 1)
    inline float wrapUnit(float t)
    {
        t = std::fmod(t, 1.0f);
        if (t < 0) t += 1.0f;
        return t;
    }

    inline float lerp(float a, float b, float t) { return a + (b - a) * t; }

    // Nearest integer with .5 ties rounded up (2.5 -> 3, -2.5 -> -2)
    inline int roundHalfUp(float v) { return (int)std::floor(v + 0.5f); }

} // namespace WaveMath
} // namespace wavegrid
