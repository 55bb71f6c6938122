#pragma once

#include <array>
#include "fmcore/synth/algorithm.h"
#include "fmcore/synth/envelope_generator.h"
#include "fmcore/synth/operator.h"
#include "fmcore/synth/voice_parameters.h"

namespace fmcore {

constexpr int kNumScales = 12;

/**
 * FM TONE voice machine: four operators, one envelope per operator slot and
 * one of the eight algorithms.
 *
 * The envelope in the C slot is the amplitude envelope of the whole voice and
 * is applied after the X/Y mix. The A, B1 and B2 envelopes shape the
 * modulator levels.
 */
class FmToneVoice {
public:
    explicit FmToneVoice(double sampleRate = 48000.0);

    void setSampleRate(double sampleRate);

    // Note events
    void noteOn(int note, int velocity, const ToneParameters& params, float volume);
    void noteOff();
    void forceRelease(float seconds);
    void reset();

    // Live parameter update without retriggering
    void applyParameters(const ToneParameters& params, float volume);

    float renderSample();

    bool isFinished() const;
    bool isReleasing() const { return envelopes_[OpC].isReleasing(); }
    bool hasFaulted() const;

    // State access
    float getBaseFrequency() const { return baseFrequency_; }
    float getVelocityGain() const { return velocityGain_; }
    const Operator& getOperator(int slot) const { return operators_[slot]; }
    const EnvelopeGenerator& getEnvelope(int slot) const { return envelopes_[slot]; }
    const AlgorithmRouter& getRouter() const { return router_; }

    static int quantizeToScale(int note, int scale, int root);
    static float computeBaseFrequency(int note, const ToneParameters& params);

private:
    void configureOperators(const ToneParameters& params);
    void configureEnvelopes(const ToneParameters& params);

    double sampleRate_;
    float sampleDuration_;
    std::array<Operator, kNumOperators> operators_;
    std::array<EnvelopeGenerator, kNumOperators> envelopes_;
    AlgorithmRouter router_;
    int note_;
    float baseFrequency_;
    float velocityGain_;
    float mix_;
    float volume_;
};

} // namespace fmcore
