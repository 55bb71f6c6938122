#pragma once

#include <array>
#include <cstdint>
#include "fmcore/synth/envelope_generator.h"
#include "fmcore/synth/operator.h"
#include "fmcore/synth/voice_parameters.h"

namespace fmcore {

/**
 * FM DRUM voice machine: a three operator FM body with a pitch sweep, a
 * band-passed noise transient and a wavefolder, all under a one-shot
 * amplitude envelope.
 */
class FmDrumVoice {
public:
    explicit FmDrumVoice(double sampleRate = 48000.0);

    void setSampleRate(double sampleRate);

    void noteOn(int note, int velocity, const DrumParameters& params, float volume);
    void noteOff();
    void forceRelease(float seconds);
    void reset();

    void applyParameters(const DrumParameters& params, float volume);

    float renderSample();

    bool isFinished() const { return ampEnvelope_.isIdle() && noiseEnvelope_.isIdle(); }
    bool isReleasing() const { return ampEnvelope_.isReleasing(); }
    bool hasFaulted() const;

    DrumType getDrumType() const { return params_.type; }
    float getBaseFrequency() const { return baseFrequency_; }
    float getSweepLevel() const { return sweepLevel_; }
    const EnvelopeGenerator& getAmpEnvelope() const { return ampEnvelope_; }

private:
    // Per drum type body tuning
    struct Voicing {
        float ratios[3];
        float levels[3];
        float modulationIndex[3];
        float noiseCutoff;          // Hz
        float noiseResonance;
        float ampDecay;             // Seconds
        float noiseDecay;           // Seconds
    };

    static const Voicing& voicingFor(DrumType type);
    void configureEnvelopes();
    float renderBody();
    float renderNoise();

    double sampleRate_;
    float sampleDuration_;
    std::array<Operator, 3> body_;
    EnvelopeGenerator ampEnvelope_;
    EnvelopeGenerator noiseEnvelope_;
    DrumParameters params_;
    float baseFrequency_;
    float velocityGain_;
    float volume_;

    // Pitch sweep
    float sweepLevel_;
    float sweepElapsed_;

    // Noise source and state variable band-pass
    uint32_t noiseState_;
    float filterLow_;
    float filterBand_;
};

} // namespace fmcore
