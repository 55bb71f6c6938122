#include "fmcore/synth/fm_tone_voice.h"
#include <algorithm>
#include <cmath>

namespace fmcore {

namespace {
constexpr float kPi = 3.14159265f;

// One character per semitone above the root, '1' marks a scale degree
const char* const kScalePatterns[kNumScales] = {
    "111111111111",     // Chromatic
    "101011010101",     // Major
    "101101011010",     // Natural minor
    "101101010110",     // Dorian
    "110101011010",     // Phrygian
    "101010110101",     // Lydian
    "101011010110",     // Mixolydian
    "110101101010",     // Locrian
    "101101011001",     // Harmonic minor
    "101101010101",     // Melodic minor
    "101010010100",     // Major pentatonic
    "100101010010",     // Minor pentatonic
};
}

FmToneVoice::FmToneVoice(double sampleRate)
    : sampleRate_(sampleRate)
    , sampleDuration_(static_cast<float>(1.0 / sampleRate))
    , note_(60)
    , baseFrequency_(261.6256f)
    , velocityGain_(1.0f)
    , mix_(0.0f)
    , volume_(1.0f)
{
    setSampleRate(sampleRate);
}

void FmToneVoice::setSampleRate(double sampleRate) {
    if (sampleRate <= 0.0) {
        return;
    }
    sampleRate_ = sampleRate;
    sampleDuration_ = static_cast<float>(1.0 / sampleRate);
    for (auto& op : operators_) {
        op.setSampleRate(sampleRate);
    }
}

void FmToneVoice::noteOn(int note, int velocity, const ToneParameters& params, float volume) {
    note_ = note;
    float sensitivity = std::clamp(params.velocitySensitivity, 0.0f, 1.0f);
    float normalizedVelocity = std::clamp(velocity, 0, 127) / 127.0f;
    velocityGain_ = (1.0f - sensitivity) + sensitivity * normalizedVelocity;

    applyParameters(params, volume);

    for (auto& op : operators_) {
        op.setRatioImmediate(op.getRatio());
        if (params.phaseReset) {
            op.resetPhase();
        }
    }
    for (auto& env : envelopes_) {
        env.noteOn();
    }
}

void FmToneVoice::noteOff() {
    for (auto& env : envelopes_) {
        env.noteOff();
    }
}

void FmToneVoice::forceRelease(float seconds) {
    for (auto& env : envelopes_) {
        env.forceRelease(seconds);
    }
}

void FmToneVoice::reset() {
    for (auto& op : operators_) {
        op.reset();
    }
    for (auto& env : envelopes_) {
        env.reset();
    }
}

void FmToneVoice::applyParameters(const ToneParameters& params, float volume) {
    if (!router_.setAlgorithm(params.algorithm)) {
        router_.setAlgorithm(std::clamp(params.algorithm, 1, kNumAlgorithms));
    }
    router_.setModulationDepth(kPi * (1.0f + 3.0f * std::clamp(params.harmony, 0.0f, 1.0f)));
    mix_ = std::clamp(params.mix, 0.0f, 1.0f);
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    baseFrequency_ = computeBaseFrequency(note_, params);

    configureOperators(params);
    configureEnvelopes(params);
}

void FmToneVoice::configureOperators(const ToneParameters& params) {
    for (auto& op : operators_) {
        op.setBaseFrequency(baseFrequency_);
        op.setFeedbackAmount(params.feedback);
    }

    operators_[OpC].setRatio(params.ratioC);
    operators_[OpC].setFineDetuneCents(0.0f);
    operators_[OpC].setOutputLevel(1.0f);

    operators_[OpA].setRatio(params.ratioA);
    operators_[OpA].setFineDetuneCents(params.detune + params.offsetA);
    operators_[OpA].setOutputLevel(params.levelA);

    operators_[OpB1].setRatio(params.ratioB);
    operators_[OpB1].setFineDetuneCents(-params.detune + params.offsetB);
    operators_[OpB1].setOutputLevel(params.levelB);

    operators_[OpB2].setRatio(params.ratioB);
    operators_[OpB2].setFineDetuneCents(params.detune + params.offsetB);
    operators_[OpB2].setOutputLevel(params.levelB);
}

void FmToneVoice::configureEnvelopes(const ToneParameters& params) {
    EnvelopeSettings amp;
    amp.attackTime = params.ampAttack;
    amp.decayTime = params.ampDecay;
    amp.sustainLevel = params.ampSustain;
    amp.endLevel = 0.0f;
    amp.releaseTime = params.ampRelease;
    amp.triggerMode = TriggerMode::Gate;
    envelopes_[OpC].setSettings(amp);

    // Modulator envelopes hold at their end level when gated
    EnvelopeSettings modA;
    modA.delayTime = params.delay;
    modA.attackTime = params.attackA;
    modA.decayTime = params.decayA;
    modA.endLevel = params.endA;
    modA.sustainLevel = params.endA;
    modA.releaseTime = params.ampRelease;
    modA.triggerMode = params.trigMode;
    envelopes_[OpA].setSettings(modA);

    EnvelopeSettings modB = modA;
    modB.attackTime = params.attackB;
    modB.decayTime = params.decayB;
    modB.endLevel = params.endB;
    modB.sustainLevel = params.endB;
    envelopes_[OpB1].setSettings(modB);
    envelopes_[OpB2].setSettings(modB);
}

float FmToneVoice::renderSample() {
    float amplitude = envelopes_[OpC].advance(sampleDuration_);
    for (int slot = OpA; slot <= OpB2; ++slot) {
        operators_[slot].setEnvelopeLevel(envelopes_[slot].advance(sampleDuration_));
    }
    operators_[OpC].setEnvelopeLevel(1.0f);

    // Modulators are inaudible once the amplitude envelope has closed
    if (envelopes_[OpC].isIdle()) {
        for (int slot = OpA; slot <= OpB2; ++slot) {
            envelopes_[slot].reset();
        }
    }

    AlgorithmRouter::Output out = router_.render(operators_);
    float mixed = (1.0f - mix_) * out.x + mix_ * out.y;
    return mixed * amplitude * velocityGain_ * volume_;
}

bool FmToneVoice::isFinished() const {
    for (const auto& env : envelopes_) {
        if (!env.isIdle()) {
            return false;
        }
    }
    return true;
}

bool FmToneVoice::hasFaulted() const {
    for (const auto& op : operators_) {
        if (op.hasFaulted()) {
            return true;
        }
    }
    return false;
}

int FmToneVoice::quantizeToScale(int note, int scale, int root) {
    if (scale <= 0 || scale >= kNumScales) {
        return note;
    }
    const char* pattern = kScalePatterns[scale];
    int degree = (((note - ((root % 12) + 12) % 12) % 12) + 12) % 12;
    int steps = 0;
    while (pattern[degree] != '1') {
        degree = (degree + 11) % 12;
        steps++;
    }
    return note - steps;
}

float FmToneVoice::computeBaseFrequency(int note, const ToneParameters& params) {
    int quantized = quantizeToScale(note, params.scale, params.root);
    float semitones = 60.0f + (quantized - 60) * params.keyTracking
                    + params.tune + params.fine / 100.0f;
    // A4 (MIDI note 69) = 440 Hz
    return 440.0f * std::pow(2.0f, (semitones - 69.0f) / 12.0f);
}

} // namespace fmcore
