#include "CoherentNoise.h"
#include "WaveMath.h"
#include <juce_core/juce_core.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace wavegrid {

static float fade(float t) { return t * t * t * (t * (t * 6 - 15) + 10); }

static float grad(int hash, float x, float y, float z)
{
    int h = hash & 15;                  // low 4 bits -> 12 gradient directions
    float u = h < 8 ? x : y;
    float v = h < 4 ? y : (h == 12 || h == 14 ? x : z);
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

CoherentNoise::CoherentNoise(int64_t seed, int octaves, float falloff)
    : octaves_(std::max(1, octaves)),
      falloff_(juce::jlimit(0.0f, 1.0f, falloff))
{
    std::array<uint8_t, 256> p;
    std::iota(p.begin(), p.end(), (uint8_t)0);

    // Fisher-Yates with the seeded JUCE generator
    juce::Random rng(seed);
    for (int i = 255; i > 0; --i) {
        int j = rng.nextInt(i + 1);
        std::swap(p[(size_t)i], p[(size_t)j]);
    }

    for (size_t i = 0; i < 512; ++i)
        perm_[i] = p[i & 255];
}

float CoherentNoise::gradientNoise(float x, float y, float z) const
{
    float fx = std::floor(x), fy = std::floor(y), fz = std::floor(z);
    int X = (int)fx & 255;
    int Y = (int)fy & 255;
    int Z = (int)fz & 255;
    x -= fx; y -= fy; z -= fz;

    float u = fade(x), v = fade(y), w = fade(z);
    int A = perm(X) + Y,     AA = perm(A) + Z, AB = perm(A + 1) + Z;
    int B = perm(X + 1) + Y, BA = perm(B) + Z, BB = perm(B + 1) + Z;

    float x1 = x - 1, y1 = y - 1, z1 = z - 1;

    using WaveMath::lerp;
    return lerp(lerp(lerp(grad(perm(AA), x, y, z),      grad(perm(BA), x1, y, z), u),
                     lerp(grad(perm(AB), x, y1, z),     grad(perm(BB), x1, y1, z), u), v),
                lerp(lerp(grad(perm(AA + 1), x, y, z1),  grad(perm(BA + 1), x1, y, z1), u),
                     lerp(grad(perm(AB + 1), x, y1, z1), grad(perm(BB + 1), x1, y1, z1), u), v),
                w);
}

float CoherentNoise::sample(float x, float y, float z) const
{
    float sum = 0.0f, ampSum = 0.0f;
    float amp = 1.0f, freq = 1.0f;

    for (int o = 0; o < octaves_; ++o) {
        float n = gradientNoise(x * freq, y * freq, z * freq);
        sum += (n * 0.5f + 0.5f) * amp;
        ampSum += amp;
        amp *= falloff_;
        freq *= 2.0f;
    }

    if (ampSum <= 0.0f) return 0.5f;
    return WaveMath::constrain(sum / ampSum, 0.0f, 1.0f);
}

} // namespace wavegrid
