#include "FieldDriver.h"
#include <juce_core/juce_core.h>
#include <algorithm>

namespace wavegrid {

FieldDriver::FieldDriver(const ParameterSet& params, int cols, int rows, int trailCapacity)
    : params_(params),
      cols_(std::max(1, cols)),
      rows_(std::max(1, rows)),
      engine_(params),
      trail_(cols_, rows_, trailCapacity)
{
}

void FieldDriver::tick(int frameIndex)
{
    frameIndex_ = frameIndex;
    engine_.update(frameIndex, params_.getWaveSpeed());
    if (trailsEnabled_)
        trail_.capture(engine_, frameIndex);
}

HSBFrame FieldDriver::currentFrame()
{
    if (trailsEnabled_ && !trail_.isEmpty())
        return trail_.compositeHSB();
    return directFrame();
}

HSBFrame FieldDriver::directFrame()
{
    auto cells = (size_t)(cols_ * rows_);
    HSBFrame out;
    out.hue.assign(cells, 0.0f);
    out.saturation.assign(cells, 0.0f);
    out.brightness.assign(cells, 0.0f);
    if (frameIndex_ < 0) return out;

    auto tx = (float)cols_, ty = (float)rows_;
    for (int y = 0; y < rows_; ++y) {
        for (int x = 0; x < cols_; ++x) {
            auto idx = (size_t)(y * cols_ + x);
            out.brightness[idx] = engine_.calculateColorCustom(frameIndex_, x, y, tx, ty);
            out.hue[idx]        = engine_.calculateHue(frameIndex_, x, y, tx, ty);
            out.saturation[idx] = engine_.calculateSaturation(frameIndex_, x, y, tx, ty);
        }
    }
    return out;
}

void FieldDriver::setTrailsEnabled(bool on)
{
    if (on == trailsEnabled_) return;
    trailsEnabled_ = on;
    // Re-enabling starts from an empty history
    if (!on) trail_.clear();
    DBG("[driver] Trails " + juce::String(on ? "enabled" : "disabled"));
}

} // namespace wavegrid
