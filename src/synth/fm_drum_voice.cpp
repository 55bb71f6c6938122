#include "fmcore/synth/fm_drum_voice.h"
#include <algorithm>
#include <cmath>

namespace fmcore {

namespace {
constexpr float kPi = 3.14159265f;
constexpr float kMaxSweepOctaves = 4.0f;
constexpr float kDrumRelease = 0.05f;
}

const FmDrumVoice::Voicing& FmDrumVoice::voicingFor(DrumType type) {
    static const Voicing voicings[] = {
        // Kick: series chain 2 -> 1 -> 0
        {{1.0f, 2.0f, 0.5f}, {1.0f, 0.8f, 0.6f}, {0.0f, 2.0f, 1.5f}, 80.0f, 0.5f, 0.3f, 0.05f},
        // Snare: 2 and 1 in parallel into 0, inharmonic buzz
        {{1.0f, 3.7f, 1.3f}, {1.0f, 0.6f, 0.7f}, {0.0f, 1.2f, 1.8f}, 200.0f, 0.7f, 0.15f, 0.1f},
        // Hi-hat: three inharmonic carriers
        {{4.0f, 6.7f, 9.3f}, {0.8f, 0.6f, 0.4f}, {0.5f, 0.3f, 0.2f}, 8000.0f, 0.3f, 0.05f, 0.04f},
        // Tom: series chain with a softer modulator
        {{1.0f, 1.8f, 0.7f}, {1.0f, 0.7f, 0.5f}, {0.0f, 1.5f, 1.0f}, 150.0f, 0.4f, 0.4f, 0.08f},
        // Cymbal: partially modulated stack, all three audible
        {{2.3f, 5.1f, 8.7f}, {0.9f, 0.6f, 0.4f}, {0.8f, 0.6f, 0.4f}, 5000.0f, 0.2f, 0.8f, 0.6f},
    };
    int index = std::clamp(static_cast<int>(type), 0, 4);
    return voicings[index];
}

FmDrumVoice::FmDrumVoice(double sampleRate)
    : sampleRate_(sampleRate)
    , sampleDuration_(static_cast<float>(1.0 / sampleRate))
    , baseFrequency_(65.4064f)
    , velocityGain_(1.0f)
    , volume_(1.0f)
    , sweepLevel_(0.0f)
    , sweepElapsed_(0.0f)
    , noiseState_(0x9E3779B9u)
    , filterLow_(0.0f)
    , filterBand_(0.0f)
{
    setSampleRate(sampleRate);
    configureEnvelopes();
}

void FmDrumVoice::setSampleRate(double sampleRate) {
    if (sampleRate <= 0.0) {
        return;
    }
    sampleRate_ = sampleRate;
    sampleDuration_ = static_cast<float>(1.0 / sampleRate);
    for (auto& op : body_) {
        op.setSampleRate(sampleRate);
    }
}

void FmDrumVoice::noteOn(int note, int velocity, const DrumParameters& params, float volume) {
    baseFrequency_ = 440.0f * std::pow(2.0f, (static_cast<float>(note) - 69.0f) / 12.0f);
    velocityGain_ = std::clamp(velocity, 0, 127) / 127.0f;
    applyParameters(params, volume);

    for (auto& op : body_) {
        op.reset();
    }
    sweepElapsed_ = 0.0f;
    sweepLevel_ = 1.0f;
    filterLow_ = 0.0f;
    filterBand_ = 0.0f;

    ampEnvelope_.noteOn();
    noiseEnvelope_.noteOn();
}

void FmDrumVoice::noteOff() {
    // One-shot envelopes run their course
    ampEnvelope_.noteOff();
    noiseEnvelope_.noteOff();
}

void FmDrumVoice::forceRelease(float seconds) {
    ampEnvelope_.forceRelease(seconds);
    noiseEnvelope_.forceRelease(seconds);
}

void FmDrumVoice::reset() {
    for (auto& op : body_) {
        op.reset();
    }
    ampEnvelope_.reset();
    noiseEnvelope_.reset();
    sweepLevel_ = 0.0f;
    filterLow_ = 0.0f;
    filterBand_ = 0.0f;
}

void FmDrumVoice::applyParameters(const DrumParameters& params, float volume) {
    params_ = params;
    volume_ = std::clamp(volume, 0.0f, 1.0f);

    const Voicing& voicing = voicingFor(params_.type);
    for (size_t i = 0; i < body_.size(); ++i) {
        body_[i].setRatio(voicing.ratios[i]);
        body_[i].setOutputLevel(voicing.levels[i]);
    }
    configureEnvelopes();
}

void FmDrumVoice::configureEnvelopes() {
    const Voicing& voicing = voicingFor(params_.type);

    EnvelopeSettings amp;
    amp.attackTime = 0.001f;
    amp.decayTime = voicing.ampDecay;
    amp.endLevel = 0.0f;
    amp.releaseTime = kDrumRelease;
    amp.triggerMode = TriggerMode::Trigger;
    ampEnvelope_.setSettings(amp);

    EnvelopeSettings noise = amp;
    noise.decayTime = voicing.noiseDecay;
    noiseEnvelope_.setSettings(noise);
}

float FmDrumVoice::renderSample() {
    float amplitude = ampEnvelope_.advance(sampleDuration_);
    float noiseLevel = noiseEnvelope_.advance(sampleDuration_);
    if (ampEnvelope_.isIdle()) {
        noiseEnvelope_.reset();
        return 0.0f;
    }

    // Pitch sweep falls quadratically from the top of the sweep to the note
    sweepElapsed_ += sampleDuration_;
    if (params_.sweepTime <= 0.0f || sweepElapsed_ >= params_.sweepTime) {
        sweepLevel_ = 0.0f;
    } else {
        float remaining = 1.0f - sweepElapsed_ / params_.sweepTime;
        sweepLevel_ = remaining * remaining;
    }
    float pitch = std::pow(2.0f, params_.sweepAmount * kMaxSweepOctaves * sweepLevel_);
    for (auto& op : body_) {
        op.setBaseFrequency(baseFrequency_ * pitch);
    }

    float mixed = renderBody() * params_.bodyTone
                + renderNoise() * noiseLevel * params_.noiseLevel;

    if (params_.wavefold > 0.0f) {
        float folded = std::sin(mixed * (1.0f + 4.0f * params_.wavefold) * kPi * 0.5f);
        mixed = mixed * (1.0f - params_.wavefold) + folded * params_.wavefold;
    }

    return mixed * amplitude * velocityGain_ * volume_;
}

float FmDrumVoice::renderBody() {
    const Voicing& voicing = voicingFor(params_.type);
    const float* index = voicing.modulationIndex;

    switch (params_.type) {
        case DrumType::Kick:
        case DrumType::Tom: {
            float op2 = body_[2].renderSample(0.0f);
            float op1 = body_[1].renderSample(op2 * index[2]);
            return body_[0].renderSample(op1 * index[1]);
        }
        case DrumType::Snare: {
            float op2 = body_[2].renderSample(0.0f);
            float op1 = body_[1].renderSample(0.0f);
            return body_[0].renderSample(op2 * index[2] + op1 * index[1] * 0.5f);
        }
        case DrumType::HiHat: {
            float op0 = body_[0].renderSample(0.0f);
            float op1 = body_[1].renderSample(0.0f);
            float op2 = body_[2].renderSample(0.0f);
            return (op0 + op1 * 0.7f + op2 * 0.5f) / 2.2f;
        }
        case DrumType::Cymbal: {
            float op2 = body_[2].renderSample(0.0f);
            float op1 = body_[1].renderSample(op2 * index[2] * 0.3f);
            float op0 = body_[0].renderSample(op1 * index[1] * 0.8f);
            return (op0 + op1 * 0.4f + op2 * 0.2f) / 1.6f;
        }
    }
    return 0.0f;
}

float FmDrumVoice::renderNoise() {
    // xorshift32
    noiseState_ ^= noiseState_ << 13;
    noiseState_ ^= noiseState_ >> 17;
    noiseState_ ^= noiseState_ << 5;
    float noise = static_cast<float>(noiseState_) / 2147483648.0f - 1.0f;

    const Voicing& voicing = voicingFor(params_.type);
    float f = 2.0f * std::sin(kPi * voicing.noiseCutoff / static_cast<float>(sampleRate_));
    f = std::min(f, 0.9f);  // Stability limit
    float q = std::max(1.0f - voicing.noiseResonance * 0.9f, 0.1f);

    float high = noise - filterLow_ - q * filterBand_;
    filterBand_ += f * high;
    filterLow_ += f * filterBand_;
    return std::clamp(filterBand_, -1.0f, 1.0f);
}

bool FmDrumVoice::hasFaulted() const {
    for (const auto& op : body_) {
        if (op.hasFaulted()) {
            return true;
        }
    }
    return !std::isfinite(filterBand_) || !std::isfinite(filterLow_);
}

} // namespace fmcore
