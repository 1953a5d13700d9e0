#pragma once

#include <juce_core/juce_core.h>
#include <functional>
#include <string>

namespace wavegrid {

// ============================================================
// ParameterSet: wave/colour ranges read by the field engine
// Ranges: hue 0-360, saturation/brightness 0-255.
// A hue or saturation range with min == max is a fixed value.
// ============================================================
class ParameterSet {
public:
    ParameterSet() = default;

    // --- Animation ---
    float getWaveSpeed() const         { return waveSpeed_; }
    float getWaveAngle() const         { return waveAngle_; }
    float getWaveMultiplierMin() const { return waveMultiplierMin_; }
    float getWaveMultiplierMax() const { return waveMultiplierMax_; }
    int   getAnimationFPS() const      { return animationFPS_; }
    int   getAnimationDuration() const { return animationDuration_; }

    // --- Colour (HSB) ---
    float getHueMin() const            { return hueMin_; }
    float getHueMax() const            { return hueMax_; }
    float getSaturationMin() const     { return saturationMin_; }
    float getSaturationMax() const     { return saturationMax_; }
    float getBrightnessMin() const     { return brightnessMin_; }
    float getBrightnessMax() const     { return brightnessMax_; }
    float getWaveAmplitudeMin() const  { return waveAmplitudeMin_; }
    float getWaveAmplitudeMax() const  { return waveAmplitudeMax_; }

    bool hasHueWave() const        { return hueMin_ != hueMax_; }
    bool hasSaturationWave() const { return saturationMin_ != saturationMax_; }

    // Setters clamp into the documented ranges and fire onChanged
    void setWaveSpeed(float v);
    void setWaveAngle(float degrees);   // reduced mod 360
    void setWaveMultiplierMin(float v);
    void setWaveMultiplierMax(float v);
    void setMultiplierRange(float min, float max);
    void setAnimationFPS(int fps);      // >= 1
    void setAnimationDuration(int seconds); // >= 1

    void setHueMin(float v);
    void setHueMax(float v);
    void setHueRange(float min, float max);
    void setSaturationMin(float v);
    void setSaturationMax(float v);
    void setSaturationRange(float min, float max);
    void setBrightnessMin(float v);
    void setBrightnessMax(float v);
    void setBrightnessRange(float min, float max);
    void setWaveAmplitudeMin(float v);
    void setWaveAmplitudeMax(float v);
    void setAmplitudeRange(float min, float max);

    // Called with the parameter key after every change ("*" after a bulk load)
    std::function<void(const std::string& key)> onChanged;

    // JSON serialization: { "animation": {...}, "colors": {...} }
    juce::var toVar() const;
    juce::Result fromVar(const juce::var& v);
    juce::String toJSON() const;
    juce::Result fromJSON(const juce::String& json);

    // File I/O
    bool saveToFile(const juce::File& file) const;
    juce::Result loadFromFile(const juce::File& file);

    juce::Result validate() const;

private:
    void notify(const std::string& key);

    float waveSpeed_         = 1.0f;
    float waveAngle_         = 45.0f;
    float waveMultiplierMin_ = 0.0f;
    float waveMultiplierMax_ = 2.0f;
    int   animationFPS_      = 30;
    int   animationDuration_ = 18;

    float hueMin_            = 0.0f;
    float hueMax_            = 0.0f;
    float saturationMin_     = 0.0f;
    float saturationMax_     = 0.0f;
    float brightnessMin_     = 50.0f;
    float brightnessMax_     = 255.0f;
    float waveAmplitudeMin_  = -200.0f;
    float waveAmplitudeMax_  = 200.0f;
};

} // namespace wavegrid
