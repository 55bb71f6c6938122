#include "fmcore/sequencer/step_sequencer.h"
#include "fmcore/engine/trigger_bridge.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace fmcore {

namespace {
constexpr double kMinTempo = 30.0;
constexpr double kMaxTempo = 300.0;
constexpr float kMinSwing = 50.0f;
constexpr float kMaxSwing = 80.0f;
constexpr float kMinRetrigRate = 1.0f / 16.0f;
constexpr float kMaxRetrigRate = 4.0f;
}

StepSequencer::StepSequencer(double sampleRate, double tempo, int stepsPerBeat)
    : sampleRate_(sampleRate > 0.0 ? sampleRate : 48000.0)
    , tempo_(std::clamp(tempo, kMinTempo, kMaxTempo))
    , stepsPerBeat_(std::max(stepsPerBeat, 1))
    , swing_(kMinSwing)
    , playing_(false)
    , startFrame_(0)
    , anchorFrame_(0)
    , anchorStep_(0.0)
{
}

void StepSequencer::setPattern(const Pattern& pattern) {
    pattern_ = pattern;
    for (auto& track : pattern_.tracks) {
        if (track.length < 1 || track.length > kMaxSteps) {
            std::cerr << "StepSequencer: Track " << track.trackId << " length " << track.length
                      << " clamped to 1.." << kMaxSteps << std::endl;
            track.length = std::clamp(track.length, 1, kMaxSteps);
        }
        for (auto& trig : track.steps) {
            trig.gateLength = std::max(trig.gateLength, 0.0f);
            trig.microTiming = std::clamp(trig.microTiming, -0.5f, 0.5f);
            trig.retrigCount = std::clamp(trig.retrigCount, 0, kMaxRetrigs);
            trig.retrigRate = std::clamp(trig.retrigRate, kMinRetrigRate, kMaxRetrigRate);
        }
    }
}

void StepSequencer::setTempo(double bpm, int64_t atFrame) {
    if (std::isnan(bpm)) {
        return;
    }
    if (playing_ && atFrame >= 0) {
        anchorStep_ = frameToStep(static_cast<double>(atFrame));
        anchorFrame_ = atFrame;
    }
    tempo_ = std::clamp(bpm, kMinTempo, kMaxTempo);
}

void StepSequencer::setSwing(float percent) {
    if (std::isnan(percent)) {
        return;
    }
    swing_ = std::clamp(percent, kMinSwing, kMaxSwing);
}

void StepSequencer::setSampleRate(double sampleRate) {
    if (sampleRate > 0.0) {
        sampleRate_ = sampleRate;
    }
}

void StepSequencer::start(int64_t frame) {
    startFrame_ = frame;
    anchorFrame_ = frame;
    anchorStep_ = 0.0;
    playing_ = true;
}

void StepSequencer::stop() {
    playing_ = false;
}

double StepSequencer::getFramesPerStep() const {
    return sampleRate_ * 60.0 / (tempo_ * stepsPerBeat_);
}

double StepSequencer::stepToFrame(int64_t step) const {
    return anchorFrame_ + (static_cast<double>(step) - anchorStep_) * getFramesPerStep();
}

double StepSequencer::frameToStep(double frame) const {
    return anchorStep_ + (frame - anchorFrame_) / getFramesPerStep();
}

double StepSequencer::hitFrame(int64_t step, const Trig& trig, int hit) const {
    const double framesPerStep = getFramesPerStep();
    double frame = stepToFrame(step) + trig.microTiming * framesPerStep
                 + hit * trig.retrigRate * framesPerStep;
    if (step % 2 == 1) {
        // Swing: the second step of each pair moves toward the next pair
        frame += (2.0 * swing_ / 100.0 - 1.0) * framesPerStep;
    }
    return std::max(frame, static_cast<double>(startFrame_));
}

int64_t StepSequencer::nextOnset(const TrackPattern& track, int defaultNote, int note,
                                 int64_t step, int64_t onset, int64_t limit) const {
    const double framesPerStep = getFramesPerStep();
    int64_t lastStep = step + static_cast<int64_t>(std::ceil((limit - onset) / framesPerStep)) + 2;
    int64_t next = limit;
    for (int64_t candidate = step; candidate <= lastStep; ++candidate) {
        int index = static_cast<int>(candidate % track.length);
        if (index >= static_cast<int>(track.steps.size())) {
            continue;
        }
        const Trig& trig = track.steps[index];
        if (!trig.active || trig.note.value_or(defaultNote) != note) {
            continue;
        }
        for (int hit = 0; hit <= trig.retrigCount; ++hit) {
            int64_t frame = std::llround(hitFrame(candidate, trig, hit));
            if (frame > onset && frame < next) {
                next = frame;
            }
        }
    }
    return next;
}

size_t StepSequencer::schedule(int64_t fromFrame, int64_t toFrame, TriggerBridge& bridge) {
    if (!playing_ || toFrame <= fromFrame) {
        return 0;
    }

    const double framesPerStep = getFramesPerStep();

    // Earliest step that can still land in the window: hits reach at most
    // one step of swing, half a step of micro-timing and the retrig span later.
    const double lookBack = 2.0 + kMaxRetrigs * kMaxRetrigRate;
    int64_t firstStep = static_cast<int64_t>(std::floor(frameToStep(static_cast<double>(fromFrame)) - lookBack));
    int64_t lastStep = static_cast<int64_t>(std::ceil(frameToStep(static_cast<double>(toFrame)) + 1.0));
    firstStep = std::max<int64_t>(firstStep, static_cast<int64_t>(std::ceil(anchorStep_ - 1.0)));
    firstStep = std::max<int64_t>(firstStep, 0);

    size_t accepted = 0;
    for (const auto& track : pattern_.tracks) {
        for (int64_t step = firstStep; step <= lastStep; ++step) {
            int index = static_cast<int>(step % track.length);
            if (index >= static_cast<int>(track.steps.size())) {
                continue;
            }
            const Trig& trig = track.steps[index];
            if (!trig.active) {
                continue;
            }

            const int defaultNote = bridge.getDefaultNote(track.trackId);
            int note = trig.note.value_or(defaultNote);
            for (int hit = 0; hit <= trig.retrigCount; ++hit) {
                int64_t onset = std::llround(hitFrame(step, trig, hit));
                if (onset < fromFrame || onset >= toFrame) {
                    continue;
                }

                // Retrig hits end before the next hit starts
                double gateSteps = trig.gateLength;
                if (trig.retrigCount > 0) {
                    gateSteps = std::min<double>(gateSteps, trig.retrigRate * 0.9);
                }
                int64_t gateFrames = std::max<int64_t>(1, std::llround(gateSteps * framesPerStep));
                // Releases are keyed by track and note, so a long gate must not
                // outlive the next onset of the same note
                int64_t next = nextOnset(track, defaultNote, note, step, onset, onset + gateFrames);
                gateFrames = std::max<int64_t>(1, next - onset);

                TriggerStatus status = bridge.onStepEvent(index, track.trackId, note, trig.velocity,
                                                          trig.locks, onset);
                if (status == TriggerStatus::Accepted) {
                    ++accepted;
                    bridge.onStepRelease(track.trackId, note, onset + gateFrames);
                }
            }
        }
    }
    return accepted;
}

} // namespace fmcore
