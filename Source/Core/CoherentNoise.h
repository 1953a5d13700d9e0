#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace wavegrid {

// ============================================================
// CoherentNoise: seeded 3D improved-Perlin noise, octave-summed
// Output is in [0, 1]. Immutable after construction, so one
// instance can be shared by any number of wave strategies.
// ============================================================
class CoherentNoise {
public:
    explicit CoherentNoise(int64_t seed = 0, int octaves = 4, float falloff = 0.5f);

    float sample(float x, float y, float z) const;

    int getOctaves() const  { return octaves_; }
    float getFalloff() const { return falloff_; }

private:
    // Single octave, roughly [-1, 1]
    float gradientNoise(float x, float y, float z) const;
    int perm(int i) const { return perm_[(std::size_t)(i & 511)]; }

    std::array<uint8_t, 512> perm_ {};
    int octaves_;
    float falloff_;
};

} // namespace wavegrid
