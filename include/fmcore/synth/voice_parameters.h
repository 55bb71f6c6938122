#pragma once

#include "fmcore/synth/envelope_generator.h"

namespace fmcore {

enum class MachineType {
    FmTone = 0,
    FmDrum = 1
};

enum class DrumType {
    Kick = 0,
    Snare = 1,
    HiHat = 2,
    Tom = 3,
    Cymbal = 4
};

/**
 * DSP-domain settings of the FM TONE machine
 */
struct ToneParameters {
    int algorithm = 1;              // 1 to 8
    float ratioC = 1.0f;
    float ratioA = 1.0f;
    float ratioB = 2.0f;            // Shared by B1 and B2
    float harmony = 0.0f;           // Scales the modulation depth
    float detune = 0.0f;            // Cents, spread across A, B1 and B2
    float feedback = 0.0f;
    float mix = 0.0f;               // 0 = X bus only, 1 = Y bus only

    // Modulator envelope A
    float attackA = 0.001f;
    float decayA = 0.5f;
    float endA = 0.0f;
    float levelA = 0.5f;

    // Modulator envelope B (B1 and B2)
    float attackB = 0.001f;
    float decayB = 0.5f;
    float endB = 0.0f;
    float levelB = 0.3f;

    float delay = 0.0f;             // Modulator envelope delay in seconds
    TriggerMode trigMode = TriggerMode::Gate;
    bool phaseReset = true;

    // Pitch
    float keyTracking = 1.0f;
    float offsetA = 0.0f;           // Cents
    float offsetB = 0.0f;           // Cents
    float velocitySensitivity = 0.5f;
    int scale = 0;                  // Index into the scale table, 0 = chromatic
    int root = 0;                   // Pitch class 0 to 11
    float tune = 0.0f;              // Semitones
    float fine = 0.0f;              // Cents

    // Amplitude envelope (operator C slot)
    float ampAttack = 0.005f;
    float ampDecay = 0.3f;
    float ampSustain = 0.7f;
    float ampRelease = 0.3f;
};

/**
 * DSP-domain settings of the FM DRUM machine
 */
struct DrumParameters {
    DrumType type = DrumType::Kick;
    float bodyTone = 0.7f;
    float noiseLevel = 0.3f;
    float sweepAmount = 0.4f;       // 0 to 1, up to four octaves of pitch drop
    float sweepTime = 0.1f;         // Seconds
    float wavefold = 0.2f;
};

/**
 * Everything a voice needs to start a note
 */
struct VoiceParameters {
    MachineType machine = MachineType::FmTone;
    float volume = 0.8f;
    ToneParameters tone;
    DrumParameters drum;
};

} // namespace fmcore
