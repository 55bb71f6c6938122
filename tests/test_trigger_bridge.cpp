#include <cassert>
#include <string>
#include <vector>
#include "fmcore/audio/audio_buffer.h"
#include "fmcore/engine/synth_engine.h"
#include "fmcore/engine/trigger_bridge.h"
#include "fmcore/midi/midi_message.h"
#include "fmcore/synth/voice_allocator.h"

using namespace fmcore;

namespace {

void renderBlock(SynthEngine& engine) {
    AudioBuffer buffer(1, 256);
    engine.process(buffer, 256);
}

} // namespace

void testStepEventDefaults() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    assert(bridge.onStepEvent(0, 1, std::nullopt, std::nullopt) == TriggerStatus::Accepted);
    bridge.setDefaultNote(2, 36);
    assert(bridge.getDefaultNote(2) == 36);
    assert(bridge.onStepEvent(1, 2, std::nullopt, 80) == TriggerStatus::Accepted);
    renderBlock(engine);

    VoiceAllocator& allocator = engine.getAllocator();
    assert(allocator.getVoice(0).getTrackId() == 1);
    assert(allocator.getVoice(0).getNote() == TriggerBridge::kDefaultNote);
    assert(allocator.getVoice(0).getVelocity() == TriggerBridge::kDefaultVelocity);
    assert(allocator.getVoice(1).getNote() == 36);
    assert(allocator.getVoice(1).getVelocity() == 80);
    assert(bridge.getAcceptedEventCount() == 2);
}

void testStepEventValidation() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    assert(bridge.onStepEvent(0, 7, 60, 100) == TriggerStatus::UnknownTrack);
    assert(bridge.onStepEvent(0, -1, 60, 100) == TriggerStatus::UnknownTrack);
    assert(bridge.onStepEvent(0, 0, 200, 100) == TriggerStatus::InvalidNote);
    assert(bridge.onStepEvent(0, 0, 60, 0) == TriggerStatus::InvalidVelocity);
    assert(bridge.onStepEvent(0, 0, 60, 128) == TriggerStatus::InvalidVelocity);
    assert(bridge.getDroppedEventCount() == 5);
    assert(bridge.getAcceptedEventCount() == 0);

    renderBlock(engine);
    assert(engine.getStatus().activeVoices == 0);
}

void testStepLocksReachTheVoice() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    std::vector<ParameterLock> locks = {{ParameterId::Mix, 1.0f}, {ParameterId::Harmony, 0.5f}};
    assert(bridge.onStepEvent(4, 0, 60, 100, locks) == TriggerStatus::Accepted);
    renderBlock(engine);

    const Voice& voice = engine.getAllocator().getVoice(0);
    assert(voice.isLocked(ParameterId::Mix));
    assert(voice.isLocked(ParameterId::Harmony));
    assert(voice.getParameters().tone.mix == 1.0f);
}

void testLockOverflowStillPlays() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    std::vector<TriggerStatus> reported;
    bridge.setDiagnosticCallback([&reported](TriggerStatus status, const std::string&) {
        reported.push_back(status);
    });

    std::vector<ParameterLock> locks;
    for (size_t i = 0; i < kMaxLocksPerNote + 3; ++i) {
        locks.push_back({static_cast<ParameterId>(i), 0.5f});
    }
    locks.push_back({ParameterId::Count, 0.5f});

    assert(bridge.onStepEvent(0, 0, 60, 100, locks) == TriggerStatus::Accepted);
    assert(reported.size() == 1);
    assert(reported[0] == TriggerStatus::InvalidParameter);
    assert(bridge.getDroppedEventCount() == 0);

    renderBlock(engine);
    const Voice& voice = engine.getAllocator().getVoice(0);
    assert(voice.getLocks().count() == kMaxLocksPerNote);
}

void testExternalNotes() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    assert(bridge.onExternalNoteEvent(true, 64, 90, 1) == TriggerStatus::Accepted);
    renderBlock(engine);
    const Voice& voice = engine.getAllocator().getVoice(0);
    assert(voice.getTrackId() == 1);
    assert(voice.getState() == VoiceState::Active);

    // Velocity 0 is a release
    assert(bridge.onExternalNoteEvent(true, 64, 0, 1) == TriggerStatus::Accepted);
    renderBlock(engine);
    assert(voice.getState() == VoiceState::Releasing);

    // Channels past the track count are unmapped
    assert(bridge.getTrackForChannel(9) == -1);
    assert(bridge.onExternalNoteEvent(true, 64, 90, 9) == TriggerStatus::UnknownChannel);

    bridge.setChannelMapping(9, 3);
    assert(bridge.getTrackForChannel(9) == 3);
    assert(bridge.onExternalNoteEvent(true, 64, 90, 9) == TriggerStatus::Accepted);

    bridge.setChannelMapping(9, 12);
    assert(bridge.getTrackForChannel(9) == 3);
    bridge.setChannelMapping(9, -1);
    assert(bridge.getTrackForChannel(9) == -1);
}

void testMidiMessages() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    assert(bridge.onMidiMessage(MidiMessage::noteOn(0, 60, 100)) == TriggerStatus::Accepted);
    assert(bridge.onMidiMessage(MidiMessage::noteOff(0, 60)) == TriggerStatus::Accepted);
    assert(bridge.onMidiMessage(MidiMessage(std::vector<uint8_t>{0x90, 60})) == TriggerStatus::InvalidMessage);
    assert(bridge.onMidiMessage(MidiMessage(std::vector<uint8_t>{0xC0, 5})) == TriggerStatus::Ignored);
    assert(bridge.getDroppedEventCount() == 1);
}

void testControlChangeRouting() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    assert(bridge.getControlChangeMapping(19) == ParameterId::Feedback);
    assert(bridge.onExternalControlChange(19, 127, 0) == TriggerStatus::Accepted);
    assert(bridge.onExternalControlChange(74, 64, 0) == TriggerStatus::Ignored);

    bridge.mapControlChange(74, ParameterId::Detune);
    assert(bridge.onExternalControlChange(74, 0, 2) == TriggerStatus::Accepted);
    bridge.unmapControlChange(74);
    assert(!bridge.getControlChangeMapping(74).has_value());

    // Channel mode controllers cannot be taken over
    bridge.mapControlChange(123, ParameterId::Mix);
    assert(!bridge.getControlChangeMapping(123).has_value());

    assert(bridge.onExternalControlChange(200, 0, 0) == TriggerStatus::InvalidParameter);

    renderBlock(engine);
    assert(engine.getTrackParameters(0).get(ParameterId::Feedback) == 1.0f);
}

void testChannelModeMessages() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    bridge.onExternalNoteEvent(true, 60, 100, 0);
    bridge.onExternalNoteEvent(true, 62, 100, 1);
    renderBlock(engine);
    assert(engine.getStatus().activeVoices == 2);

    assert(bridge.onExternalControlChange(123, 0, 5) == TriggerStatus::Accepted);
    renderBlock(engine);
    VoiceAllocator& allocator = engine.getAllocator();
    assert(allocator.getVoice(0).getState() == VoiceState::Releasing);
    assert(allocator.getVoice(1).getState() == VoiceState::Releasing);

    assert(bridge.onExternalControlChange(120, 0, 0) == TriggerStatus::Accepted);
    renderBlock(engine);
    assert(engine.getStatus().activeVoices == 0);
}

void testParameterEdits() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    assert(bridge.onParameterChange(ParameterId::Tune, 0.75f, 3) == TriggerStatus::Accepted);
    assert(bridge.onParameterChange(ParameterId::Count, 0.5f, 0) == TriggerStatus::InvalidParameter);
    assert(bridge.onParameterChange(ParameterId::Tune, 0.5f, 4) == TriggerStatus::UnknownTrack);

    ParameterSet set;
    set.set(ParameterId::Volume, 0.25f);
    assert(bridge.onParameterSetLoaded(set, 1) == TriggerStatus::Accepted);
    assert(bridge.onParameterSetLoaded(set, 9) == TriggerStatus::UnknownTrack);

    renderBlock(engine);
    assert(engine.getTrackParameters(3).get(ParameterId::Tune) == 0.75f);
    assert(engine.getTrackParameters(1).get(ParameterId::Volume) == 0.25f);
}

void testQueueFullIsReported() {
    SynthEngine engine;
    TriggerBridge bridge(engine);

    for (size_t i = 0; i < SynthEngine::kCommandQueueCapacity; ++i) {
        assert(bridge.onStepRelease(0, 60) == TriggerStatus::Accepted);
    }
    assert(bridge.onStepRelease(0, 60) == TriggerStatus::QueueFull);
    assert(bridge.getDroppedEventCount() == 1);
    assert(std::string(toString(TriggerStatus::QueueFull)) == "queue full");
}

int main() {
    testStepEventDefaults();
    testStepEventValidation();
    testStepLocksReachTheVoice();
    testLockOverflowStillPlays();
    testExternalNotes();
    testMidiMessages();
    testControlChangeRouting();
    testChannelModeMessages();
    testParameterEdits();
    testQueueFullIsReported();
    return 0;
}
