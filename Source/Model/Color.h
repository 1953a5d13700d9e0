#pragma once

#include <algorithm>
#include <cmath>

namespace wavegrid {

// 8-bit RGB colour for terminal / host output
struct Rgb8 {
    int r = 0, g = 0, b = 0;

    constexpr Rgb8() = default;
    constexpr Rgb8(int r_, int g_, int b_) : r(r_), g(g_), b(b_) {}

    bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

// ============================================================
// HSB → 8-bit RGB
// hue 0-360, saturation 0-255, brightness 0-255 (engine ranges)
// ============================================================
inline Rgb8 hsbToRgb(float hue, float saturation, float brightness)
{
    float h = std::fmod(hue, 360.0f);
    if (h < 0) h += 360.0f;
    float s = std::max(0.0f, std::min(1.0f, saturation / 255.0f));
    float v = std::max(0.0f, std::min(1.0f, brightness / 255.0f));

    float c = v * s;
    float x = c * (1.0f - std::abs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
    float m = v - c;

    float r1, g1, b1;
    if (h < 60)       { r1 = c; g1 = x; b1 = 0; }
    else if (h < 120) { r1 = x; g1 = c; b1 = 0; }
    else if (h < 180) { r1 = 0; g1 = c; b1 = x; }
    else if (h < 240) { r1 = 0; g1 = x; b1 = c; }
    else if (h < 300) { r1 = x; g1 = 0; b1 = c; }
    else              { r1 = c; g1 = 0; b1 = x; }

    return {
        (int)std::round((r1 + m) * 255),
        (int)std::round((g1 + m) * 255),
        (int)std::round((b1 + m) * 255)
    };
}

// Brightness (0-255) → glyph from a dark-to-light ASCII ramp
inline char brightnessGlyph(float brightness)
{
    static const char ramp[] = " .:-=+*#%@";
    constexpr int steps = (int)sizeof(ramp) - 2;
    float v = std::max(0.0f, std::min(255.0f, brightness));
    return ramp[(int)std::round(v / 255.0f * steps)];
}

} // namespace wavegrid
