#include "fmcore/synth/operator.h"
#include <algorithm>
#include <cmath>

namespace fmcore {

namespace {
constexpr double kTwoPi = 6.283185307179586;
constexpr float kRatioSmoothingSeconds = 0.005f;
constexpr float kMinRatio = 0.0f;
}

Operator::Operator()
    : sampleRate_(48000.0)
    , baseFrequency_(440.0f)
    , targetRatio_(1.0f)
    , currentRatio_(1.0f)
    , ratioCoefficient_(0.0f)
    , fineDetuneCents_(0.0f)
    , detuneMultiplier_(1.0f)
    , phase_(0.0)
    , outputLevel_(1.0f)
    , feedbackAmount_(0.0f)
    , envelopeLevel_(1.0f)
    , modulationInput_(0.0f)
    , lastOutput_(0.0f)
    , previousOutput_(0.0f)
    , faulted_(false)
{
    setSampleRate(sampleRate_);
}

void Operator::setSampleRate(double sampleRate) {
    if (sampleRate <= 0.0) {
        return;
    }
    sampleRate_ = sampleRate;
    ratioCoefficient_ = static_cast<float>(
        std::exp(-1.0 / (kRatioSmoothingSeconds * sampleRate_)));
}

void Operator::setRatio(float ratio) {
    targetRatio_ = std::max(ratio, kMinRatio);
}

void Operator::setRatioImmediate(float ratio) {
    targetRatio_ = std::max(ratio, kMinRatio);
    currentRatio_ = targetRatio_;
}

void Operator::setFineDetuneCents(float cents) {
    fineDetuneCents_ = cents;
    detuneMultiplier_ = std::pow(2.0f, cents / 1200.0f);
}

float Operator::getFrequency() const {
    return baseFrequency_ * currentRatio_ * detuneMultiplier_;
}

void Operator::setOutputLevel(float level) {
    outputLevel_ = std::clamp(level, 0.0f, 1.0f);
}

void Operator::setFeedbackAmount(float amount) {
    feedbackAmount_ = std::clamp(amount, 0.0f, 1.0f);
}

float Operator::renderSample(float modulationInput) {
    modulationInput_ = modulationInput;

    // Ratio glide, then advance the phase by one sample
    currentRatio_ = targetRatio_ + (currentRatio_ - targetRatio_) * ratioCoefficient_;
    phase_ += kTwoPi * static_cast<double>(getFrequency()) / sampleRate_;
    if (phase_ >= kTwoPi || phase_ < 0.0) {
        phase_ = std::fmod(phase_, kTwoPi);
        if (phase_ < 0.0) {
            phase_ += kTwoPi;
        }
    }

    float output = static_cast<float>(std::sin(phase_ + static_cast<double>(modulationInput)))
                   * outputLevel_ * envelopeLevel_;

    if (!std::isfinite(output)) {
        faulted_ = true;
        output = 0.0f;
    } else {
        output = std::clamp(output, -1.0f, 1.0f);
    }

    previousOutput_ = lastOutput_;
    lastOutput_ = output;
    return output;
}

void Operator::resetPhase() {
    phase_ = 0.0;
    lastOutput_ = 0.0f;
    previousOutput_ = 0.0f;
}

void Operator::reset() {
    resetPhase();
    currentRatio_ = targetRatio_;
    modulationInput_ = 0.0f;
    envelopeLevel_ = 1.0f;
    faulted_ = false;
}

} // namespace fmcore
