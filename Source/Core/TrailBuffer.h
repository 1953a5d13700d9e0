#pragma once

#include <functional>
#include <string>
#include <vector>

namespace wavegrid {

class WaveFieldEngine;

enum class BlendMode { Add, Max, Average };

inline BlendMode blendModeFromString(const std::string& s)
{
    if (s == "max")     return BlendMode::Max;
    if (s == "average") return BlendMode::Average;
    return BlendMode::Add;
}

inline std::string blendModeToString(BlendMode m)
{
    switch (m) {
        case BlendMode::Max:     return "max";
        case BlendMode::Average: return "average";
        default:                 return "add";
    }
}

// Flat per-cell channels, index = row * cols + col
struct HSBFrame {
    std::vector<float> hue;         // 0-360
    std::vector<float> saturation;  // 0-255
    std::vector<float> brightness;  // 0-255
};

// ============================================================
// TrailBuffer: fixed-capacity ring of past frames
//
// The newest slot is at (head - 1 + maxLength) % maxLength;
// age t (0 = newest) lives at (head - 1 - t + 2*maxLength) % maxLength.
// Storage is allocated once and never resized.
// ============================================================
class TrailBuffer {
public:
    using CellFn = std::function<float(int x, int y)>;

    TrailBuffer(int cols, int rows, int maxLength);

    // --- Capture ---
    // Evaluates the three channels for every cell into the next slot.
    // Cells outside (cols, rows) ∩ buffer size are written as 0.
    void capture(const CellFn& brightnessOf, const CellFn& hueOf, const CellFn& saturationOf,
                 int cols, int rows);

    // Brightness via calculateColorCustom, hue/saturation via the engine
    void capture(WaveFieldEngine& engine, int frameIndex);

    // Brightness only; hue/saturation slots are zeroed
    void captureRaw(const std::vector<float>& values);

    // --- Compositing ---
    // grid[row][col] brightness, clamped to [0, 255]
    std::vector<std::vector<float>> composite() const;

    // Weighted-average hue/saturation, weighted-sum brightness
    HSBFrame compositeHSB() const;

    int effectiveTrailLength() const;

    // --- Configuration ---
    void setTrailLength(int n);          // [1, maxLength]
    void setFadeDecay(float d);          // [0, 1]
    void setBlendMode(BlendMode mode) { blendMode_ = mode; }

    void setTemporalWave(float amplitude, float frequency);
    void disableTemporalWave() { useTemporalWave_ = false; }

    void setFramerateReactive(bool on, float targetFPS);
    void feedFramerate(float fps);

    void setAudioReactive(int minTrail, int maxTrail);
    void disableAudioReactive() { audioReactive_ = false; }
    void feedAudioLevel(float level);

    // Discard history without releasing storage
    void clear();

    // --- Accessors ---
    int getFilledFrames() const { return filled_; }
    int getCols() const         { return cols_; }
    int getRows() const         { return rows_; }
    int getMaxLength() const    { return maxLength_; }
    int getTrailLength() const  { return trailLength_; }
    float getFadeDecay() const  { return fadeDecay_; }
    BlendMode getBlendMode() const { return blendMode_; }
    float getSmoothedFramerate() const { return framerateSmooth_; }
    float getAudioLevel() const { return audioLevel_; }
    bool isEmpty() const        { return filled_ == 0; }

private:
    struct Slot {
        std::vector<float> brightness, hue, saturation;
    };

    void advance();
    int sourceIndex(int age) const;
    int temporalOffset(int cellIndex, int age) const;

    const int cols_;
    const int rows_;
    const int maxLength_;
    std::vector<Slot> slots_;

    int head_   = 0;   // next write position
    int filled_ = 0;   // slots holding data

    int trailLength_;
    float fadeDecay_ = 0.7f;
    BlendMode blendMode_ = BlendMode::Add;

    bool useTemporalWave_  = false;
    float temporalWaveAmp_  = 3.0f;   // max age offset
    float temporalWaveFreq_ = 0.3f;   // spatial frequency

    bool framerateReactive_ = false;
    float targetFPS_        = 60.0f;
    float framerateSmooth_  = 60.0f;  // EMA

    bool audioReactive_ = false;
    float audioLevel_   = 0.0f;
    int audioMinTrail_  = 2;
    int audioMaxTrail_;
};

} // namespace wavegrid
