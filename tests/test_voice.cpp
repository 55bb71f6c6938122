#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include "fmcore/synth/fm_drum_voice.h"
#include "fmcore/synth/fm_tone_voice.h"
#include "fmcore/synth/voice.h"

using namespace fmcore;

namespace {
constexpr double kSampleRate = 48000.0;
}

void testBaseFrequency() {
    ToneParameters params;
    assert(std::fabs(FmToneVoice::computeBaseFrequency(69, params) - 440.0f) < 1e-3f);
    assert(std::fabs(FmToneVoice::computeBaseFrequency(60, params) - 261.6256f) < 1e-2f);

    params.tune = 12.0f;
    assert(std::fabs(FmToneVoice::computeBaseFrequency(69, params) - 880.0f) < 1e-2f);

    // No key tracking pins every note to middle C
    params.tune = 0.0f;
    params.keyTracking = 0.0f;
    assert(std::fabs(FmToneVoice::computeBaseFrequency(90, params) - 261.6256f) < 1e-2f);
}

void testScaleQuantization() {
    // Chromatic passes through
    assert(FmToneVoice::quantizeToScale(61, 0, 0) == 61);
    // C major snaps C# down to C
    assert(FmToneVoice::quantizeToScale(61, 1, 0) == 60);
    assert(FmToneVoice::quantizeToScale(64, 1, 0) == 64);
    // D major: C natural snaps down to B
    assert(FmToneVoice::quantizeToScale(60, 1, 2) == 59);
}

void testVelocitySensitivity() {
    ToneParameters params;
    params.velocitySensitivity = 1.0f;
    FmToneVoice voice(kSampleRate);
    voice.noteOn(60, 127, params, 1.0f);
    assert(std::fabs(voice.getVelocityGain() - 1.0f) < 1e-6f);

    params.velocitySensitivity = 0.0f;
    voice.noteOn(60, 1, params, 1.0f);
    assert(voice.getVelocityGain() == 1.0f);
}

void testEndToEndPitch() {
    // Note 60, velocity 100, algorithm 1, modulators silent
    VoiceParameters params;
    params.tone.algorithm = 1;
    params.tone.levelA = 0.0f;
    params.tone.levelB = 0.0f;

    Voice voice(kSampleRate);
    voice.noteOn(60, 100, params);

    // Skip the attack, then count rising zero crossings over one second
    for (int i = 0; i < 4800; ++i) {
        voice.renderSample();
    }
    int crossings = 0;
    int firstCrossing = -1;
    int lastCrossing = -1;
    float previous = voice.renderSample();
    for (int i = 0; i < 48000; ++i) {
        float sample = voice.renderSample();
        assert(std::isfinite(sample));
        if (previous < 0.0f && sample >= 0.0f) {
            if (firstCrossing < 0) {
                firstCrossing = i;
            }
            lastCrossing = i;
            crossings++;
        }
        previous = sample;
    }
    assert(crossings > 2);
    double period = static_cast<double>(lastCrossing - firstCrossing) / (crossings - 1);
    double expected = kSampleRate / 261.63;
    assert(std::fabs(period - expected) / expected < 0.01);
}

void testVoiceLifecycle() {
    VoiceParameters params;
    params.tone.ampRelease = 0.01f;

    Voice voice(kSampleRate);
    assert(voice.getState() == VoiceState::Free);

    voice.setTrackId(2);
    voice.noteOn(64, 90, params);
    assert(voice.getState() == VoiceState::Active);
    assert(voice.getNote() == 64);
    assert(voice.getVelocity() == 90);
    assert(voice.getTrackId() == 2);

    for (int i = 0; i < 2400; ++i) {
        voice.renderSample();
    }
    voice.noteOff();
    assert(voice.getState() == VoiceState::Releasing);

    int rendered = 0;
    while (!voice.isFinished() && rendered < 48000) {
        voice.renderSample();
        rendered++;
    }
    assert(voice.isFinished());
    assert(rendered < 4800);

    voice.reset();
    assert(voice.isFree());
}

void testMachineSwitch() {
    VoiceParameters drum;
    drum.machine = MachineType::FmDrum;

    Voice voice(kSampleRate);
    voice.noteOn(36, 127, drum);
    assert(voice.getMachineType() == MachineType::FmDrum);

    // A live update cannot swap the running machine
    VoiceParameters tone;
    voice.updateParameters(tone);
    assert(voice.getMachineType() == MachineType::FmDrum);

    voice.reset();
    voice.noteOn(60, 100, tone);
    assert(voice.getMachineType() == MachineType::FmTone);
}

void testDrumIsOneShot() {
    DrumParameters params;
    params.type = DrumType::Kick;
    params.sweepAmount = 1.0f;
    params.sweepTime = 0.05f;

    FmDrumVoice drum(kSampleRate);
    drum.noteOn(36, 127, params, 1.0f);
    drum.noteOff();

    float peak = 0.0f;
    float firstSweep = -1.0f;
    int rendered = 0;
    while (!drum.isFinished() && rendered < 96000) {
        float sample = drum.renderSample();
        assert(std::isfinite(sample));
        peak = std::max(peak, std::fabs(sample));
        if (rendered == 10) {
            firstSweep = drum.getSweepLevel();
        }
        rendered++;
    }
    assert(drum.isFinished());
    assert(peak > 0.05f);
    assert(firstSweep > 0.9f);
    assert(drum.getSweepLevel() == 0.0f);
    // Kick decay is a fraction of a second
    assert(rendered < 48000);
}

void testEveryDrumTypeRenders() {
    for (int type = 0; type <= 4; ++type) {
        DrumParameters params;
        params.type = static_cast<DrumType>(type);
        params.wavefold = 1.0f;
        params.noiseLevel = 1.0f;

        FmDrumVoice drum(kSampleRate);
        drum.noteOn(60, 100, params, 1.0f);
        assert(drum.getDrumType() == params.type);
        float energy = 0.0f;
        for (int i = 0; i < 4800; ++i) {
            float sample = drum.renderSample();
            assert(std::isfinite(sample));
            assert(std::fabs(sample) <= 1.0f);
            energy += sample * sample;
        }
        assert(energy > 0.0f);
        assert(!drum.hasFaulted());
    }
}

void testNonFiniteRatioFaults() {
    ToneParameters params;
    params.ratioC = std::numeric_limits<float>::infinity();
    FmToneVoice voice(kSampleRate);
    voice.noteOn(60, 100, params, 1.0f);
    for (int i = 0; i < 10; ++i) {
        voice.renderSample();
    }
    assert(voice.hasFaulted());
}

int main() {
    testBaseFrequency();
    testScaleQuantization();
    testVelocitySensitivity();
    testEndToEndPitch();
    testVoiceLifecycle();
    testMachineSwitch();
    testDrumIsOneShot();
    testEveryDrumTypeRenders();
    testNonFiniteRatioFaults();
    return 0;
}
