#pragma once

#include <cstddef>

namespace fmcore {

/**
 * Single sine operator of an FM voice.
 *
 * Phase is kept in radians in [0, 2pi). The frequency is
 * baseFrequency * ratio * 2^(fineDetuneCents / 1200). Ratio changes glide
 * through a one-pole smoother so the instantaneous frequency never steps.
 */
class Operator {
public:
    Operator();

    void setSampleRate(double sampleRate);
    double getSampleRate() const { return sampleRate_; }

    // Tuning
    void setBaseFrequency(float frequency) { baseFrequency_ = frequency; }
    float getBaseFrequency() const { return baseFrequency_; }
    void setRatio(float ratio);
    void setRatioImmediate(float ratio);
    float getRatio() const { return targetRatio_; }
    float getCurrentRatio() const { return currentRatio_; }
    void setFineDetuneCents(float cents);
    float getFineDetuneCents() const { return fineDetuneCents_; }
    float getFrequency() const;

    // Levels
    void setOutputLevel(float level);
    float getOutputLevel() const { return outputLevel_; }
    void setFeedbackAmount(float amount);
    float getFeedbackAmount() const { return feedbackAmount_; }
    void setEnvelopeLevel(float level) { envelopeLevel_ = level; }

    // Rendering
    float renderSample(float modulationInput);
    float getLastOutput() const { return lastOutput_; }
    float feedbackSignal() const { return 0.5f * (lastOutput_ + previousOutput_); }
    float getModulationInput() const { return modulationInput_; }
    double getPhase() const { return phase_; }

    // Resets
    void resetPhase();
    void reset();
    bool hasFaulted() const { return faulted_; }

private:
    double sampleRate_;
    float baseFrequency_;
    float targetRatio_;
    float currentRatio_;
    float ratioCoefficient_;    // One-pole smoothing coefficient for ratio glides
    float fineDetuneCents_;
    float detuneMultiplier_;
    double phase_;
    float outputLevel_;
    float feedbackAmount_;
    float envelopeLevel_;
    float modulationInput_;
    float lastOutput_;
    float previousOutput_;
    bool faulted_;
};

} // namespace fmcore
