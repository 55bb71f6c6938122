#pragma once

namespace fmcore {

enum class EnvelopeStage {
    Idle,
    Delay,
    Attack,
    Decay,
    SustainHold,
    Release
};

/**
 * Envelope trigger modes
 *  Gate    - holds the sustain level until noteOff()
 *  Trigger - fixed length, releases on its own after the decay stage
 *  Loop    - restarts the attack each time the release completes
 */
enum class TriggerMode {
    Gate = 0,
    Trigger = 1,
    Loop = 2
};

enum class EnvelopeCurve {
    Linear,
    Exponential     // Fast start, slow finish: 1 - (1 - p)^3
};

/**
 * Envelope shape parameters (times in seconds, levels 0.0 to 1.0)
 */
struct EnvelopeSettings {
    float delayTime = 0.0f;
    float attackTime = 0.005f;
    float decayTime = 0.3f;
    float endLevel = 0.0f;          // Decay target in trigger and loop modes
    float sustainLevel = 0.7f;      // Decay target and hold level in gate mode
    float releaseTime = 0.3f;
    TriggerMode triggerMode = TriggerMode::Gate;
    EnvelopeCurve attackCurve = EnvelopeCurve::Linear;
    EnvelopeCurve decayCurve = EnvelopeCurve::Exponential;
    EnvelopeCurve releaseCurve = EnvelopeCurve::Exponential;
    bool legato = false;            // noteOn() continues from the current level
};

/**
 * Per-operator envelope generator advanced one sample at a time.
 *
 * Each stage ramps from the level it was entered at towards its target, so the
 * output never jumps except on an explicit reset or a non-legato noteOn().
 */
class EnvelopeGenerator {
public:
    EnvelopeGenerator();

    void setSettings(const EnvelopeSettings& settings);
    const EnvelopeSettings& getSettings() const { return settings_; }

    void setAttackTime(float seconds);
    void setDecayTime(float seconds);
    void setEndLevel(float level);
    void setSustainLevel(float level);
    void setReleaseTime(float seconds);
    void setDelayTime(float seconds);
    void setTriggerMode(TriggerMode mode) { settings_.triggerMode = mode; }

    // Gate events
    void noteOn();
    void noteOff();
    void forceRelease(float seconds);
    void reset();

    float advance(float sampleDurationSeconds);

    EnvelopeStage getStage() const { return stage_; }
    float getCurrentLevel() const { return currentLevel_; }
    bool isIdle() const { return stage_ == EnvelopeStage::Idle; }
    bool isReleasing() const { return stage_ == EnvelopeStage::Release; }
    bool isGateOpen() const { return gateOpen_; }

private:
    void enterStage(EnvelopeStage stage);
    void finishStage();
    float decayTarget() const;
    float stageDuration() const;
    static float shape(float progress, EnvelopeCurve curve);

    EnvelopeSettings settings_;
    EnvelopeStage stage_;
    float currentLevel_;
    float stageStartLevel_;
    float stageElapsed_;
    float forcedReleaseTime_;   // > 0 while a steal fade overrides releaseTime
    bool gateOpen_;
};

} // namespace fmcore
