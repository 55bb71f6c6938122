#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "fmcore/synth/parameter_set.h"

namespace fmcore {

class TriggerBridge;

/**
 * One step of a track
 */
struct Trig {
    bool active = false;
    std::optional<int> note;        // Track default note when empty
    std::optional<int> velocity;    // 100 when empty
    float gateLength = 1.0f;        // In steps
    float microTiming = 0.0f;       // Onset offset in steps, -0.5 to 0.5
    int retrigCount = 0;            // Extra hits after the first
    float retrigRate = 0.25f;       // Steps between retrig hits
    std::vector<ParameterLock> locks;
};

struct TrackPattern {
    int trackId = 0;
    int length = 16;                // 1 to 64 steps, loops independently
    std::vector<Trig> steps;
};

struct Pattern {
    std::vector<TrackPattern> tracks;
};

/**
 * Sample-accurate step scheduler.
 *
 * The host calls schedule() on the control thread with a window slightly
 * ahead of the audio thread. Every hit whose onset falls inside the window is
 * sent to the bridge as a timestamped step event together with its
 * timestamped release, so timing does not depend on when schedule() runs.
 */
class StepSequencer {
public:
    static constexpr int kMaxSteps = 64;
    static constexpr int kMaxRetrigs = 16;

    explicit StepSequencer(double sampleRate, double tempo = 120.0, int stepsPerBeat = 4);

    void setPattern(const Pattern& pattern);
    const Pattern& getPattern() const { return pattern_; }

    // During playback, atFrame re-anchors the step grid so steps already
    // scheduled keep their timing. Pass the end of the last scheduled window.
    void setTempo(double bpm, int64_t atFrame = -1);
    double getTempo() const { return tempo_; }
    void setSwing(float percent);
    float getSwing() const { return swing_; }
    void setSampleRate(double sampleRate);

    void start(int64_t frame);
    void stop();
    bool isPlaying() const { return playing_; }

    double getFramesPerStep() const;

    // Straight-grid onset of a step counted from start()
    double stepToFrame(int64_t step) const;

    // Emits every hit with onset in [fromFrame, toFrame); returns the number of
    // step events the bridge accepted
    size_t schedule(int64_t fromFrame, int64_t toFrame, TriggerBridge& bridge);

private:
    double frameToStep(double frame) const;
    double hitFrame(int64_t step, const Trig& trig, int hit) const;
    // First onset of `note` on the track after `onset`, or `limit` if none comes sooner
    int64_t nextOnset(const TrackPattern& track, int defaultNote, int note,
                      int64_t step, int64_t onset, int64_t limit) const;

    Pattern pattern_;
    double sampleRate_;
    double tempo_;
    int stepsPerBeat_;
    float swing_;
    bool playing_;
    int64_t startFrame_;
    int64_t anchorFrame_;           // Grid reference after tempo changes
    double anchorStep_;
};

} // namespace fmcore
