#pragma once

#include "scaletuner/audio_input.hpp"
#include "scaletuner/intonation_estimator.hpp"
#include "scaletuner/pitch_estimator.hpp"

namespace scaletuner {

struct TunerSettings {
    AudioConfig audio;
    double buffer_seconds = 0.1;
    int tick_interval_ms = 10;
    PitchConfig pitch;
    IntonationConfig intonation;
};

// Flat JSON file. Keys missing from the file keep their current values.
bool load_settings(const char* path, TunerSettings& st);
bool save_settings(const char* path, const TunerSettings& st);

} // namespace scaletuner
