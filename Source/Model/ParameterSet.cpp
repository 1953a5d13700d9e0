#include "ParameterSet.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace wavegrid {

static void warn(const juce::String& message)
{
    juce::Logger::writeToLog("[params] Warning: " + message);
}

static bool isNumber(const juce::var& v)
{
    return v.isInt() || v.isInt64() || v.isDouble();
}

// ============================================================
// Setters
// ============================================================
void ParameterSet::notify(const std::string& key)
{
    if (onChanged) onChanged(key);
}

void ParameterSet::setWaveSpeed(float v)
{
    waveSpeed_ = v;
    notify("waveSpeed");
}

void ParameterSet::setWaveAngle(float degrees)
{
    float a = std::fmod(degrees, 360.0f);
    if (a < 0) a += 360.0f;
    waveAngle_ = a;
    notify("waveAngle");
}

void ParameterSet::setWaveMultiplierMin(float v)
{
    waveMultiplierMin_ = v;
    notify("waveMultiplierMin");
}

void ParameterSet::setWaveMultiplierMax(float v)
{
    waveMultiplierMax_ = v;
    notify("waveMultiplierMax");
}

void ParameterSet::setMultiplierRange(float min, float max)
{
    setWaveMultiplierMin(min);
    setWaveMultiplierMax(max);
}

void ParameterSet::setAnimationFPS(int fps)
{
    animationFPS_ = std::max(1, fps);
    notify("animationFPS");
}

void ParameterSet::setAnimationDuration(int seconds)
{
    animationDuration_ = std::max(1, seconds);
    notify("animationDuration");
}

void ParameterSet::setHueMin(float v)
{
    hueMin_ = juce::jlimit(0.0f, 360.0f, v);
    notify("hueMin");
}

void ParameterSet::setHueMax(float v)
{
    hueMax_ = juce::jlimit(0.0f, 360.0f, v);
    notify("hueMax");
}

void ParameterSet::setHueRange(float min, float max)
{
    setHueMin(min);
    setHueMax(max);
}

void ParameterSet::setSaturationMin(float v)
{
    saturationMin_ = juce::jlimit(0.0f, 255.0f, v);
    notify("saturationMin");
}

void ParameterSet::setSaturationMax(float v)
{
    saturationMax_ = juce::jlimit(0.0f, 255.0f, v);
    notify("saturationMax");
}

void ParameterSet::setSaturationRange(float min, float max)
{
    setSaturationMin(min);
    setSaturationMax(max);
}

void ParameterSet::setBrightnessMin(float v)
{
    brightnessMin_ = juce::jlimit(0.0f, 255.0f, v);
    notify("brightnessMin");
}

void ParameterSet::setBrightnessMax(float v)
{
    brightnessMax_ = juce::jlimit(0.0f, 255.0f, v);
    notify("brightnessMax");
}

void ParameterSet::setBrightnessRange(float min, float max)
{
    setBrightnessMin(min);
    setBrightnessMax(max);
}

void ParameterSet::setWaveAmplitudeMin(float v)
{
    waveAmplitudeMin_ = v;
    notify("waveAmplitudeMin");
}

void ParameterSet::setWaveAmplitudeMax(float v)
{
    waveAmplitudeMax_ = v;
    notify("waveAmplitudeMax");
}

void ParameterSet::setAmplitudeRange(float min, float max)
{
    setWaveAmplitudeMin(min);
    setWaveAmplitudeMax(max);
}

// ============================================================
// JSON
// ============================================================
juce::var ParameterSet::toVar() const
{
    auto animation = new juce::DynamicObject();
    animation->setProperty("fps", animationFPS_);
    animation->setProperty("duration", animationDuration_);
    animation->setProperty("waveSpeed", waveSpeed_);
    animation->setProperty("waveAngle", waveAngle_);
    animation->setProperty("waveMultiplierMin", waveMultiplierMin_);
    animation->setProperty("waveMultiplierMax", waveMultiplierMax_);

    auto colors = new juce::DynamicObject();
    colors->setProperty("hueMin", hueMin_);
    colors->setProperty("hueMax", hueMax_);
    colors->setProperty("saturationMin", saturationMin_);
    colors->setProperty("saturationMax", saturationMax_);
    colors->setProperty("brightnessMin", brightnessMin_);
    colors->setProperty("brightnessMax", brightnessMax_);
    colors->setProperty("waveAmplitudeMin", waveAmplitudeMin_);
    colors->setProperty("waveAmplitudeMax", waveAmplitudeMax_);

    auto root = new juce::DynamicObject();
    root->setProperty("animation", juce::var(animation));
    root->setProperty("colors", juce::var(colors));
    return juce::var(root);
}

juce::Result ParameterSet::fromVar(const juce::var& v)
{
    if (!v.isObject())
        return juce::Result::fail("Parameter root must be a JSON object");

    // Parse into a scratch copy so a failed load leaves this set untouched
    ParameterSet next = *this;
    next.onChanged = nullptr;

    auto getFloat = [](const juce::var& sec, const char* key, float def) -> float {
        if (!sec.hasProperty(key)) return def;
        auto val = sec.getProperty(key, {});
        if (!isNumber(val)) {
            warn(juce::String(key) + " is not a number, keeping " + juce::String(def));
            return def;
        }
        return (float)(double)val;
    };
    auto getFloatInRange = [&](const juce::var& sec, const char* key, float def,
                               float lo, float hi) -> float {
        float val = getFloat(sec, key, def);
        if (val < lo || val > hi) {
            warn(juce::String(key) + " must be in [" + juce::String(lo) + ", "
                 + juce::String(hi) + "], keeping " + juce::String(def));
            return def;
        }
        return val;
    };
    auto getPositiveInt = [](const juce::var& sec, const char* key, int def) -> int {
        if (!sec.hasProperty(key)) return def;
        auto val = sec.getProperty(key, {});
        if (!isNumber(val) || (int)val <= 0) {
            warn(juce::String(key) + " must be positive, keeping " + juce::String(def));
            return def;
        }
        return (int)val;
    };
    auto orderPair = [](float& lo, float& hi, const char* name) {
        if (lo > hi) {
            warn(juce::String(name) + " min > max, swapping values");
            std::swap(lo, hi);
        }
    };

    auto animation = v.getProperty("animation", {});
    if (animation.isObject()) {
        next.animationFPS_      = getPositiveInt(animation, "fps", next.animationFPS_);
        next.animationDuration_ = getPositiveInt(animation, "duration", next.animationDuration_);
        next.waveSpeed_         = getFloat(animation, "waveSpeed", next.waveSpeed_);
        float angle             = std::fmod(getFloat(animation, "waveAngle", next.waveAngle_), 360.0f);
        next.waveAngle_         = angle < 0 ? angle + 360.0f : angle;
        next.waveMultiplierMin_ = getFloat(animation, "waveMultiplierMin", next.waveMultiplierMin_);
        next.waveMultiplierMax_ = getFloat(animation, "waveMultiplierMax", next.waveMultiplierMax_);
        orderPair(next.waveMultiplierMin_, next.waveMultiplierMax_, "waveMultiplier");
    }

    auto colors = v.getProperty("colors", {});
    if (colors.isObject()) {
        next.hueMin_           = getFloatInRange(colors, "hueMin", next.hueMin_, 0.0f, 360.0f);
        next.hueMax_           = getFloatInRange(colors, "hueMax", next.hueMax_, 0.0f, 360.0f);
        next.saturationMin_    = getFloatInRange(colors, "saturationMin", next.saturationMin_, 0.0f, 255.0f);
        next.saturationMax_    = getFloatInRange(colors, "saturationMax", next.saturationMax_, 0.0f, 255.0f);
        next.brightnessMin_    = getFloatInRange(colors, "brightnessMin", next.brightnessMin_, 0.0f, 255.0f);
        next.brightnessMax_    = getFloatInRange(colors, "brightnessMax", next.brightnessMax_, 0.0f, 255.0f);
        next.waveAmplitudeMin_ = getFloat(colors, "waveAmplitudeMin", next.waveAmplitudeMin_);
        next.waveAmplitudeMax_ = getFloat(colors, "waveAmplitudeMax", next.waveAmplitudeMax_);
        orderPair(next.saturationMin_, next.saturationMax_, "saturation");
        orderPair(next.brightnessMin_, next.brightnessMax_, "brightness");
    }

    auto result = next.validate();
    if (result.failed())
        return result;

    next.onChanged = std::move(onChanged);
    *this = std::move(next);
    notify("*");
    DBG("[params] Loaded: fps=" + juce::String(animationFPS_)
        + " speed=" + juce::String(waveSpeed_)
        + " angle=" + juce::String(waveAngle_));
    return juce::Result::ok();
}

juce::String ParameterSet::toJSON() const
{
    return juce::JSON::toString(toVar());
}

juce::Result ParameterSet::fromJSON(const juce::String& json)
{
    juce::var parsed;
    auto result = juce::JSON::parse(json, parsed);
    if (result.failed())
        return juce::Result::fail("Invalid parameter JSON: " + result.getErrorMessage());
    return fromVar(parsed);
}

bool ParameterSet::saveToFile(const juce::File& file) const
{
    return file.replaceWithText(toJSON());
}

juce::Result ParameterSet::loadFromFile(const juce::File& file)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Parameter file not found: " + file.getFullPathName());
    return fromJSON(file.loadFileAsString());
}

juce::Result ParameterSet::validate() const
{
    if (animationFPS_ <= 0)
        return juce::Result::fail("Animation FPS must be positive. Got: " + juce::String(animationFPS_));
    if (animationDuration_ <= 0)
        return juce::Result::fail("Animation duration must be positive. Got: " + juce::String(animationDuration_));
    if (hueMin_ < 0 || hueMin_ > 360 || hueMax_ < 0 || hueMax_ > 360)
        return juce::Result::fail("Hue values must be between 0 and 360. Got: hueMin="
                                  + juce::String(hueMin_) + ", hueMax=" + juce::String(hueMax_));
    if (saturationMin_ < 0 || saturationMin_ > 255 || saturationMax_ < 0 || saturationMax_ > 255)
        return juce::Result::fail("Saturation values must be between 0 and 255. Got: saturationMin="
                                  + juce::String(saturationMin_) + ", saturationMax=" + juce::String(saturationMax_));
    if (brightnessMin_ < 0 || brightnessMin_ > 255 || brightnessMax_ < 0 || brightnessMax_ > 255)
        return juce::Result::fail("Brightness values must be between 0 and 255. Got: brightnessMin="
                                  + juce::String(brightnessMin_) + ", brightnessMax=" + juce::String(brightnessMax_));
    return juce::Result::ok();
}

} // namespace wavegrid
