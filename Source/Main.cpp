// WaveGrid demo: runs the field driver headlessly and prints frames
// Usage: WaveGridDemo [--config=params.json] [--wave=sine|tangent|square|triangle|sawtooth|noise]
//                     [--frames=N] [--cols=N] [--rows=N] [--trail=N]
//                     [--blend=add|max|average] [--color]

#include <juce_core/juce_core.h>
#include "Model/ParameterSet.h"
#include "Model/Color.h"
#include "Core/FieldDriver.h"
#include "Core/WaveStrategy.h"
#include <algorithm>
#include <cstdio>
#include <string>

using namespace wavegrid;

static int intOption(const juce::ArgumentList& args, const char* option, int def, int minValue)
{
    if (!args.containsOption(option))
        return def;
    auto value = args.getValueForOption(option);
    if (!value.containsOnly("0123456789") || value.isEmpty()) {
        juce::Logger::writeToLog("[demo] Ignoring " + juce::String(option) + "=" + value
                                 + ", using " + juce::String(def));
        return def;
    }
    return std::max(minValue, value.getIntValue());
}

static void printFrame(const HSBFrame& frame, int cols, int rows, bool color)
{
    for (int y = 0; y < rows; ++y) {
        std::string line;
        for (int x = 0; x < cols; ++x) {
            auto idx = (size_t)(y * cols + x);
            char glyph = brightnessGlyph(frame.brightness[idx]);
            if (color) {
                auto rgb = hsbToRgb(frame.hue[idx], frame.saturation[idx], frame.brightness[idx]);
                line += "\x1b[38;2;" + std::to_string(rgb.r) + ";" + std::to_string(rgb.g)
                      + ";" + std::to_string(rgb.b) + "m";
            }
            line += glyph;
            line += glyph;  // square-ish cells in a terminal
        }
        if (color) line += "\x1b[0m";
        std::fprintf(stdout, "%s\n", line.c_str());
    }
    std::fprintf(stdout, "\n");
}

int main(int argc, char* argv[])
{
    juce::ArgumentList args(argc, argv);

    ParameterSet params;
    if (args.containsOption("--config")) {
        juce::File file = juce::File::getCurrentWorkingDirectory()
                              .getChildFile(args.getValueForOption("--config"));
        auto result = params.loadFromFile(file);
        if (result.failed()) {
            juce::Logger::writeToLog("[demo] " + result.getErrorMessage());
            return 1;
        }
    }

    int frames = intOption(args, "--frames", 24, 1);
    int cols   = intOption(args, "--cols", 32, 1);
    int rows   = intOption(args, "--rows", 16, 1);
    int trail  = intOption(args, "--trail", 0, 0);
    bool color = args.containsOption("--color");

    FieldDriver driver(params, cols, rows, std::max(1, trail));
    driver.setTrailsEnabled(trail > 0);

    if (args.containsOption("--wave")) {
        auto name = args.getValueForOption("--wave").toStdString();
        auto type = waveTypeFromString(name);
        if (waveTypeToString(type) != name) {
            juce::Logger::writeToLog("[demo] Unknown wave type: " + juce::String(name));
            return 1;
        }
        driver.engine().setCustomWaveFunction(WavePresets::get(type));
    }

    if (args.containsOption("--blend")) {
        auto name = args.getValueForOption("--blend").toStdString();
        auto mode = blendModeFromString(name);
        if (blendModeToString(mode) != name) {
            juce::Logger::writeToLog("[demo] Unknown blend mode: " + juce::String(name));
            return 1;
        }
        driver.trail().setBlendMode(mode);
    }

    const auto& strategy = driver.engine().getCustomWaveFunction();
    juce::Logger::writeToLog("[demo] " + juce::String(cols) + "x" + juce::String(rows)
                             + ", " + juce::String(frames) + " frames, wave="
                             + juce::String(strategy ? strategy->name : "Default tangent")
                             + ", trail=" + juce::String(trail));

    for (int f = 0; f < frames; ++f) {
        driver.tick(f);
        std::fprintf(stdout, "-- frame %d --\n", f);
        printFrame(driver.currentFrame(), cols, rows, color);
    }

    return 0;
}
