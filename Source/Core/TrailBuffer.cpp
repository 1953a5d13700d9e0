#include "TrailBuffer.h"
#include "WaveFieldEngine.h"
#include "WaveMath.h"
#include <juce_core/juce_core.h>
#include <algorithm>
#include <cmath>

namespace wavegrid {

TrailBuffer::TrailBuffer(int cols, int rows, int maxLength)
    : cols_(std::max(1, cols)),
      rows_(std::max(1, rows)),
      maxLength_(std::max(1, maxLength)),
      trailLength_(maxLength_),
      audioMaxTrail_(maxLength_)
{
    auto cells = (size_t)(cols_ * rows_);
    slots_.resize((size_t)maxLength_);
    for (auto& s : slots_) {
        s.brightness.assign(cells, 0.0f);
        s.hue.assign(cells, 0.0f);
        s.saturation.assign(cells, 0.0f);
    }
}

// ============================================================
// Capture
// ============================================================
void TrailBuffer::advance()
{
    head_ = (head_ + 1) % maxLength_;
    if (filled_ < maxLength_) ++filled_;
}

void TrailBuffer::capture(const CellFn& brightnessOf, const CellFn& hueOf,
                          const CellFn& saturationOf, int cols, int rows)
{
    if (cols != cols_ || rows != rows_) {
        DBG("[trail] Capture size " + juce::String(cols) + "x" + juce::String(rows)
            + " differs from buffer " + juce::String(cols_) + "x" + juce::String(rows_));
    }

    auto& slot = slots_[(size_t)head_];
    int w = std::min(cols, cols_);
    int h = std::min(rows, rows_);

    for (int j = 0; j < rows_; ++j) {
        for (int i = 0; i < cols_; ++i) {
            auto idx = (size_t)(j * cols_ + i);
            if (i < w && j < h) {
                slot.brightness[idx] = brightnessOf ? brightnessOf(i, j) : 0.0f;
                slot.hue[idx]        = hueOf ? hueOf(i, j) : 0.0f;
                slot.saturation[idx] = saturationOf ? saturationOf(i, j) : 0.0f;
            } else {
                slot.brightness[idx] = slot.hue[idx] = slot.saturation[idx] = 0.0f;
            }
        }
    }

    advance();
}

void TrailBuffer::capture(WaveFieldEngine& engine, int frameIndex)
{
    auto tx = (float)cols_, ty = (float)rows_;
    capture(
        [&](int x, int y) { return engine.calculateColorCustom(frameIndex, x, y, tx, ty); },
        [&](int x, int y) { return engine.calculateHue(frameIndex, x, y, tx, ty); },
        [&](int x, int y) { return engine.calculateSaturation(frameIndex, x, y, tx, ty); },
        cols_, rows_);
}

void TrailBuffer::captureRaw(const std::vector<float>& values)
{
    auto& slot = slots_[(size_t)head_];
    auto cells = slot.brightness.size();
    auto n = std::min(values.size(), cells);

    std::copy(values.begin(), values.begin() + (std::ptrdiff_t)n, slot.brightness.begin());
    std::fill(slot.brightness.begin() + (std::ptrdiff_t)n, slot.brightness.end(), 0.0f);
    std::fill(slot.hue.begin(), slot.hue.end(), 0.0f);
    std::fill(slot.saturation.begin(), slot.saturation.end(), 0.0f);

    advance();
}

// ============================================================
// Compositing
// ============================================================
int TrailBuffer::sourceIndex(int age) const
{
    return ((head_ - 1 - age) + maxLength_ * 2) % maxLength_;
}

int TrailBuffer::temporalOffset(int cellIndex, int age) const
{
    int col = cellIndex % cols_;
    int row = cellIndex / cols_;
    float wave = std::sin((float)(col + row) * temporalWaveFreq_ + (float)age * 0.2f);
    return WaveMath::roundHalfUp(wave * temporalWaveAmp_);
}

std::vector<std::vector<float>> TrailBuffer::composite() const
{
    std::vector<std::vector<float>> result((size_t)rows_, std::vector<float>((size_t)cols_, 0.0f));
    if (filled_ == 0) return result;

    int len = effectiveTrailLength();
    int cells = cols_ * rows_;
    std::vector<float> accum((size_t)cells, 0.0f);
    std::vector<int> counts((size_t)cells, 0);

    for (int t = 0; t < len && t < filled_; ++t) {
        float weight = std::pow(fadeDecay_, (float)t);

        for (int c = 0; c < cells; ++c) {
            int effectiveT = t + (useTemporalWave_ ? temporalOffset(c, t) : 0);
            if (effectiveT < 0 || effectiveT >= filled_) continue;

            float val = slots_[(size_t)sourceIndex(effectiveT)].brightness[(size_t)c] * weight;
            auto& acc = accum[(size_t)c];
            switch (blendMode_) {
                case BlendMode::Max:
                    acc = std::max(acc, val);
                    break;
                case BlendMode::Average:
                    acc += val;
                    ++counts[(size_t)c];
                    break;
                case BlendMode::Add:
                default:
                    acc += val;
                    break;
            }
        }
    }

    for (int j = 0; j < rows_; ++j) {
        for (int i = 0; i < cols_; ++i) {
            auto idx = (size_t)(j * cols_ + i);
            float v = accum[idx];
            if (blendMode_ == BlendMode::Average && counts[idx] > 0)
                v /= (float)counts[idx];
            result[(size_t)j][(size_t)i] = WaveMath::constrain(v, 0.0f, 255.0f);
        }
    }
    return result;
}

HSBFrame TrailBuffer::compositeHSB() const
{
    auto cells = (size_t)(cols_ * rows_);
    HSBFrame out;
    out.hue.assign(cells, 0.0f);
    out.saturation.assign(cells, 0.0f);
    out.brightness.assign(cells, 0.0f);
    if (filled_ == 0) return out;

    int len = effectiveTrailLength();
    std::vector<float> wSum(cells, 0.0f);

    for (int t = 0; t < len && t < filled_; ++t) {
        float weight = std::pow(fadeDecay_, (float)t);

        for (size_t c = 0; c < cells; ++c) {
            int effectiveT = t + (useTemporalWave_ ? temporalOffset((int)c, t) : 0);
            if (effectiveT < 0 || effectiveT >= filled_) continue;

            auto& slot = slots_[(size_t)sourceIndex(effectiveT)];
            out.hue[c]        += slot.hue[c] * weight;
            out.saturation[c] += slot.saturation[c] * weight;
            out.brightness[c] += slot.brightness[c] * weight;
            wSum[c]           += weight;
        }
    }

    // Hue/saturation blend smoothly; brightness accumulates light
    for (size_t c = 0; c < cells; ++c) {
        float w = std::max(0.001f, wSum[c]);
        out.hue[c] /= w;
        out.saturation[c] /= w;
        out.brightness[c] = WaveMath::constrain(out.brightness[c], 0.0f, 255.0f);
    }
    return out;
}

// ============================================================
// Reactive trail length
// ============================================================
int TrailBuffer::effectiveTrailLength() const
{
    int len = trailLength_;

    if (framerateReactive_) {
        // Slow frame rate -> longer trail, capped at 3x
        float ratio = targetFPS_ / std::max(1.0f, framerateSmooth_);
        len = WaveMath::roundHalfUp((float)len * WaveMath::constrain(ratio, 1.0f, 3.0f));
    }

    // Applied last: overrides the frame-rate length when both are on
    if (audioReactive_)
        len = WaveMath::roundHalfUp(WaveMath::lerp((float)audioMinTrail_, (float)audioMaxTrail_, audioLevel_));

    return std::min(len, std::min(filled_, maxLength_));
}

// ============================================================
// Configuration
// ============================================================
void TrailBuffer::setTrailLength(int n)
{
    trailLength_ = juce::jlimit(1, maxLength_, n);
}

void TrailBuffer::setFadeDecay(float d)
{
    fadeDecay_ = juce::jlimit(0.0f, 1.0f, d);
}

void TrailBuffer::setTemporalWave(float amplitude, float frequency)
{
    useTemporalWave_ = true;
    temporalWaveAmp_ = amplitude;
    temporalWaveFreq_ = frequency;
}

void TrailBuffer::setFramerateReactive(bool on, float targetFPS)
{
    framerateReactive_ = on;
    targetFPS_ = targetFPS;
}

void TrailBuffer::feedFramerate(float fps)
{
    framerateSmooth_ = framerateSmooth_ * 0.9f + fps * 0.1f;
}

void TrailBuffer::setAudioReactive(int minTrail, int maxTrail)
{
    audioReactive_ = true;
    audioMinTrail_ = std::max(1, minTrail);
    audioMaxTrail_ = std::min(maxTrail, maxLength_);
}

void TrailBuffer::feedAudioLevel(float level)
{
    audioLevel_ = juce::jlimit(0.0f, 1.0f, level);
}

void TrailBuffer::clear()
{
    head_ = 0;
    filled_ = 0;
    DBG("[trail] Cleared");
}

} // namespace wavegrid
