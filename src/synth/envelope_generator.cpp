#include "fmcore/synth/envelope_generator.h"
#include <algorithm>

namespace fmcore {

EnvelopeGenerator::EnvelopeGenerator()
    : stage_(EnvelopeStage::Idle)
    , currentLevel_(0.0f)
    , stageStartLevel_(0.0f)
    , stageElapsed_(0.0f)
    , forcedReleaseTime_(-1.0f)
    , gateOpen_(false)
{
}

void EnvelopeGenerator::setSettings(const EnvelopeSettings& settings) {
    settings_ = settings;
    setAttackTime(settings.attackTime);
    setDecayTime(settings.decayTime);
    setEndLevel(settings.endLevel);
    setSustainLevel(settings.sustainLevel);
    setReleaseTime(settings.releaseTime);
    setDelayTime(settings.delayTime);
}

void EnvelopeGenerator::setAttackTime(float seconds) {
    settings_.attackTime = std::max(seconds, 0.0f);
}

void EnvelopeGenerator::setDecayTime(float seconds) {
    settings_.decayTime = std::max(seconds, 0.0f);
}

void EnvelopeGenerator::setEndLevel(float level) {
    settings_.endLevel = std::clamp(level, 0.0f, 1.0f);
}

void EnvelopeGenerator::setSustainLevel(float level) {
    settings_.sustainLevel = std::clamp(level, 0.0f, 1.0f);
}

void EnvelopeGenerator::setReleaseTime(float seconds) {
    settings_.releaseTime = std::max(seconds, 0.0f);
}

void EnvelopeGenerator::setDelayTime(float seconds) {
    settings_.delayTime = std::max(seconds, 0.0f);
}

void EnvelopeGenerator::noteOn() {
    gateOpen_ = true;
    forcedReleaseTime_ = -1.0f;
    if (!settings_.legato) {
        currentLevel_ = 0.0f;
    }
    enterStage(settings_.delayTime > 0.0f ? EnvelopeStage::Delay : EnvelopeStage::Attack);
}

void EnvelopeGenerator::noteOff() {
    gateOpen_ = false;
    if (settings_.triggerMode == TriggerMode::Trigger) {
        return;
    }
    if (stage_ == EnvelopeStage::Idle || stage_ == EnvelopeStage::Release) {
        return;
    }
    enterStage(currentLevel_ > 0.0f ? EnvelopeStage::Release : EnvelopeStage::Idle);
}

void EnvelopeGenerator::forceRelease(float seconds) {
    gateOpen_ = false;
    if (stage_ == EnvelopeStage::Idle) {
        return;
    }
    forcedReleaseTime_ = std::max(seconds, 0.0f);
    enterStage(currentLevel_ > 0.0f ? EnvelopeStage::Release : EnvelopeStage::Idle);
}

void EnvelopeGenerator::reset() {
    gateOpen_ = false;
    forcedReleaseTime_ = -1.0f;
    currentLevel_ = 0.0f;
    enterStage(EnvelopeStage::Idle);
}

float EnvelopeGenerator::advance(float sampleDurationSeconds) {
    float target = 0.0f;
    EnvelopeCurve curve = EnvelopeCurve::Linear;

    switch (stage_) {
        case EnvelopeStage::Idle:
            currentLevel_ = 0.0f;
            return currentLevel_;
        case EnvelopeStage::SustainHold:
            return currentLevel_;
        case EnvelopeStage::Delay:
            stageElapsed_ += sampleDurationSeconds;
            if (stageElapsed_ >= stageDuration()) {
                finishStage();
            }
            return currentLevel_;
        case EnvelopeStage::Attack:
            target = 1.0f;
            curve = settings_.attackCurve;
            break;
        case EnvelopeStage::Decay:
            target = decayTarget();
            curve = settings_.decayCurve;
            break;
        case EnvelopeStage::Release:
            target = 0.0f;
            curve = settings_.releaseCurve;
            break;
    }

    stageElapsed_ += sampleDurationSeconds;
    float duration = stageDuration();
    if (duration <= 0.0f || stageElapsed_ >= duration) {
        currentLevel_ = target;
        finishStage();
    } else {
        float progress = stageElapsed_ / duration;
        currentLevel_ = stageStartLevel_ + (target - stageStartLevel_) * shape(progress, curve);
    }
    return currentLevel_;
}

void EnvelopeGenerator::enterStage(EnvelopeStage stage) {
    stage_ = stage;
    stageElapsed_ = 0.0f;
    stageStartLevel_ = currentLevel_;
}

void EnvelopeGenerator::finishStage() {
    switch (stage_) {
        case EnvelopeStage::Delay:
            enterStage(EnvelopeStage::Attack);
            break;
        case EnvelopeStage::Attack:
            enterStage(EnvelopeStage::Decay);
            break;
        case EnvelopeStage::Decay:
            if (settings_.triggerMode == TriggerMode::Gate && gateOpen_) {
                enterStage(EnvelopeStage::SustainHold);
            } else {
                enterStage(currentLevel_ > 0.0f ? EnvelopeStage::Release : EnvelopeStage::Idle);
                if (stage_ == EnvelopeStage::Idle) {
                    finishStage();
                }
            }
            break;
        case EnvelopeStage::Release:
        case EnvelopeStage::Idle:
            currentLevel_ = 0.0f;
            forcedReleaseTime_ = -1.0f;
            if (settings_.triggerMode == TriggerMode::Loop && gateOpen_) {
                enterStage(EnvelopeStage::Attack);
            } else {
                enterStage(EnvelopeStage::Idle);
            }
            break;
        case EnvelopeStage::SustainHold:
            break;
    }
}

float EnvelopeGenerator::decayTarget() const {
    return settings_.triggerMode == TriggerMode::Gate ? settings_.sustainLevel
                                                      : settings_.endLevel;
}

float EnvelopeGenerator::stageDuration() const {
    switch (stage_) {
        case EnvelopeStage::Delay:   return settings_.delayTime;
        case EnvelopeStage::Attack:  return settings_.attackTime;
        case EnvelopeStage::Decay:   return settings_.decayTime;
        case EnvelopeStage::Release:
            return forcedReleaseTime_ >= 0.0f ? forcedReleaseTime_ : settings_.releaseTime;
        default:
            return 0.0f;
    }
}

float EnvelopeGenerator::shape(float progress, EnvelopeCurve curve) {
    progress = std::clamp(progress, 0.0f, 1.0f);
    if (curve == EnvelopeCurve::Exponential) {
        float remaining = 1.0f - progress;
        return 1.0f - remaining * remaining * remaining;
    }
    return progress;
}

} // namespace fmcore
