#pragma once

#include "../Model/ParameterSet.h"
#include "WaveFieldEngine.h"
#include "TrailBuffer.h"

namespace wavegrid {

// ============================================================
// FieldDriver: one tick = update, capture, composite
// Owns the engine and trail for a fixed grid size.
// ============================================================
class FieldDriver {
public:
    FieldDriver(const ParameterSet& params, int cols, int rows, int trailCapacity);

    // Advance to frameIndex; captures into the trail when trails are on
    void tick(int frameIndex);

    // Composited trail if enabled and populated, otherwise direct engine values
    HSBFrame currentFrame();

    void setTrailsEnabled(bool on);
    bool trailsEnabled() const { return trailsEnabled_; }

    WaveFieldEngine& engine() { return engine_; }
    TrailBuffer& trail()      { return trail_; }

    int getCols() const       { return cols_; }
    int getRows() const       { return rows_; }
    int getFrameIndex() const { return frameIndex_; }

private:
    HSBFrame directFrame();

    const ParameterSet& params_;
    const int cols_;
    const int rows_;
    WaveFieldEngine engine_;
    TrailBuffer trail_;
    bool trailsEnabled_ = true;
    int frameIndex_ = -1;   // -1 until the first tick
};

} // namespace wavegrid
