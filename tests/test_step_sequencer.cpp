#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include "fmcore/audio/audio_buffer.h"
#include "fmcore/engine/synth_engine.h"
#include "fmcore/engine/trigger_bridge.h"
#include "fmcore/sequencer/step_sequencer.h"
#include "fmcore/synth/voice_allocator.h"

using namespace fmcore;

namespace {

constexpr double kSampleRate = 48000.0;

// 120 BPM, four steps per beat
constexpr double kFramesPerStep = 6000.0;

Pattern singleTrack(int length) {
    Pattern pattern;
    TrackPattern track;
    track.trackId = 0;
    track.length = length;
    track.steps.resize(length);
    pattern.tracks.push_back(track);
    return pattern;
}

// Frame of the first non-silent sample, or -1
int64_t firstSoundingFrame(SynthEngine& engine, size_t totalFrames) {
    AudioBuffer buffer(1, 256);
    int64_t position = 0;
    while (position < static_cast<int64_t>(totalFrames)) {
        engine.process(buffer, 256);
        const float* data = buffer.getReadPointer(0);
        for (size_t i = 0; i < 256; ++i) {
            if (data[i] != 0.0f) {
                return position + static_cast<int64_t>(i);
            }
        }
        position += 256;
    }
    return -1;
}

bool noteHeld(SynthEngine& engine, int note) {
    VoiceAllocator& allocator = engine.getAllocator();
    for (size_t i = 0; i < allocator.getPolyphony(); ++i) {
        const Voice& voice = allocator.getVoice(i);
        if (!voice.isFree() && voice.getNote() == note && voice.isNoteHeld()) {
            return true;
        }
    }
    return false;
}

void renderUntil(SynthEngine& engine, int64_t& position, int64_t frame) {
    AudioBuffer buffer(1, 256);
    while (position < frame) {
        size_t frames = static_cast<size_t>(std::min<int64_t>(256, frame - position));
        engine.process(buffer, frames);
        position += static_cast<int64_t>(frames);
    }
}

} // namespace

void testGridTiming() {
    StepSequencer sequencer(kSampleRate, 120.0);
    assert(std::fabs(sequencer.getFramesPerStep() - kFramesPerStep) < 1e-9);
    sequencer.start(1000);
    assert(sequencer.isPlaying());
    assert(sequencer.stepToFrame(0) == 1000.0);
    assert(sequencer.stepToFrame(4) == 1000.0 + 4 * kFramesPerStep);
}

void testStepLandsOnItsFrame() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(16);
    pattern.tracks[0].steps[2].active = true;
    sequencer.setPattern(pattern);
    sequencer.start(0);
    assert(sequencer.schedule(0, 24000, bridge) == 1);

    int64_t onset = firstSoundingFrame(engine, 14000);
    assert(onset >= 12000 && onset < 12020);
    assert(engine.getAllocator().getVoice(0).getNote() == TriggerBridge::kDefaultNote);
}

void testSwingDelaysOddSteps() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(16);
    pattern.tracks[0].steps[1].active = true;
    pattern.tracks[0].steps[1].note = 48;
    sequencer.setPattern(pattern);
    sequencer.setSwing(60.0f);
    sequencer.start(0);
    assert(sequencer.schedule(0, 12000, bridge) == 1);

    // 60% swing moves the off-beat by a fifth of a step
    int64_t onset = firstSoundingFrame(engine, 9000);
    assert(onset >= 7200 && onset < 7220);
}

void testMicroTimingAndClampToStart() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(16);
    pattern.tracks[0].steps[0].active = true;
    pattern.tracks[0].steps[0].microTiming = -0.5f;
    pattern.tracks[0].steps[2].active = true;
    pattern.tracks[0].steps[2].microTiming = -0.25f;
    sequencer.setPattern(pattern);
    sequencer.start(2000);

    // Step 0 cannot play before the sequencer started
    assert(sequencer.schedule(2000, 2001, bridge) == 1);
    assert(sequencer.schedule(2001, 12500, bridge) == 0);
    assert(sequencer.schedule(12500, 12501, bridge) == 1);
}

void testLongGateKeepsRetriggeredNote() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(16);
    for (int step = 0; step < 2; ++step) {
        pattern.tracks[0].steps[step].active = true;
        pattern.tracks[0].steps[step].note = 60;
        pattern.tracks[0].steps[step].gateLength = 2.0f;
    }
    sequencer.setPattern(pattern);
    sequencer.start(0);
    assert(sequencer.schedule(0, 48000, bridge) == 2);

    // Step 0's release must not cut the note restarted on step 1
    int64_t position = 0;
    renderUntil(engine, position, static_cast<int64_t>(2.5 * kFramesPerStep));
    assert(noteHeld(engine, 60));

    renderUntil(engine, position, static_cast<int64_t>(3.0 * kFramesPerStep) + 256);
    assert(!noteHeld(engine, 60));
}

void testPatternLoops() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(4);
    pattern.tracks[0].steps[0].active = true;
    sequencer.setPattern(pattern);
    sequencer.start(0);

    // Split windows never repeat or skip a hit
    size_t total = sequencer.schedule(0, 10000, bridge);
    total += sequencer.schedule(10000, 30000, bridge);
    total += sequencer.schedule(30000, 72000, bridge);
    assert(total == 3);
}

void testRetrigs() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(16);
    Trig& trig = pattern.tracks[0].steps[0];
    trig.active = true;
    trig.retrigCount = 3;
    trig.retrigRate = 0.25f;
    sequencer.setPattern(pattern);
    sequencer.start(0);

    assert(sequencer.schedule(0, 1500, bridge) == 1);
    assert(sequencer.schedule(1500, 6000, bridge) == 3);
    assert(sequencer.getPattern().tracks[0].steps[0].retrigCount == 3);
}

void testPatternSanitized() {
    StepSequencer sequencer(kSampleRate);
    Pattern pattern = singleTrack(16);
    pattern.tracks[0].length = 200;
    pattern.tracks[0].steps[0].microTiming = 3.0f;
    pattern.tracks[0].steps[0].retrigCount = 99;
    pattern.tracks[0].steps[0].retrigRate = 0.0f;
    sequencer.setPattern(pattern);

    const TrackPattern& track = sequencer.getPattern().tracks[0];
    assert(track.length == StepSequencer::kMaxSteps);
    assert(track.steps[0].microTiming == 0.5f);
    assert(track.steps[0].retrigCount == StepSequencer::kMaxRetrigs);
    assert(track.steps[0].retrigRate == 1.0f / 16.0f);
}

void testTempoAndSwingLimits() {
    StepSequencer sequencer(kSampleRate);
    sequencer.setTempo(1000.0);
    assert(sequencer.getTempo() == 300.0);
    sequencer.setTempo(1.0);
    assert(sequencer.getTempo() == 30.0);
    sequencer.setTempo(std::numeric_limits<double>::quiet_NaN());
    assert(sequencer.getTempo() == 30.0);

    sequencer.setSwing(95.0f);
    assert(sequencer.getSwing() == 80.0f);
    sequencer.setSwing(10.0f);
    assert(sequencer.getSwing() == 50.0f);
}

void testTempoChangeKeepsScheduledSteps() {
    StepSequencer sequencer(kSampleRate, 120.0);
    sequencer.start(0);
    sequencer.setTempo(60.0, 12000);

    // Step 2 stays where it was, later steps stretch
    assert(std::fabs(sequencer.stepToFrame(2) - 12000.0) < 1e-6);
    assert(std::fabs(sequencer.stepToFrame(3) - 24000.0) < 1e-6);
}

void testRejectedStepsNotCounted() {
    SynthEngine engine;
    TriggerBridge bridge(engine);
    StepSequencer sequencer(kSampleRate, 120.0);

    Pattern pattern = singleTrack(16);
    pattern.tracks[0].trackId = 9;
    pattern.tracks[0].steps[0].active = true;
    sequencer.setPattern(pattern);
    sequencer.start(0);
    assert(sequencer.schedule(0, 6000, bridge) == 0);
    assert(bridge.getDroppedEventCount() == 1);

    sequencer.stop();
    assert(sequencer.schedule(0, 6000, bridge) == 0);
}

int main() {
    testGridTiming();
    testStepLandsOnItsFrame();
    testSwingDelaysOddSteps();
    testMicroTimingAndClampToStart();
    testLongGateKeepsRetriggeredNote();
    testPatternLoops();
    testRetrigs();
    testPatternSanitized();
    testTempoAndSwingLimits();
    testTempoChangeKeepsScheduledSteps();
    testRejectedStepsNotCounted();
    return 0;
}
