#include "fmcore/engine/trigger_bridge.h"
#include "fmcore/engine/synth_engine.h"
#include "fmcore/midi/midi_message.h"
#include <iostream>

namespace fmcore {

namespace {

constexpr int kAllSoundOffController = 120;
constexpr int kAllNotesOffController = 123;

bool isMidiValue(int value) {
    return value >= 0 && value <= 127;
}

} // namespace

const char* toString(TriggerStatus status) {
    switch (status) {
        case TriggerStatus::Accepted: return "accepted";
        case TriggerStatus::Ignored: return "ignored";
        case TriggerStatus::InvalidNote: return "invalid note";
        case TriggerStatus::InvalidVelocity: return "invalid velocity";
        case TriggerStatus::InvalidParameter: return "invalid parameter";
        case TriggerStatus::UnknownTrack: return "unknown track";
        case TriggerStatus::UnknownChannel: return "unknown channel";
        case TriggerStatus::InvalidMessage: return "invalid message";
        case TriggerStatus::QueueFull: return "queue full";
    }
    return "unknown";
}

TriggerBridge::TriggerBridge(SynthEngine& engine)
    : engine_(engine)
    , defaultNotes_(engine.getTrackCount(), kDefaultNote)
    , droppedEvents_(0)
    , acceptedEvents_(0)
{
    // Channel n plays track n
    for (int channel = 0; channel < kMidiChannels; ++channel) {
        channelToTrack_[channel] = isValidTrack(channel) ? channel : -1;
    }

    controlMap_[1] = ParameterId::Harmony;
    controlMap_[7] = ParameterId::Volume;
    controlMap_[15] = ParameterId::Algorithm;
    controlMap_[16] = ParameterId::RatioC;
    controlMap_[17] = ParameterId::RatioA;
    controlMap_[18] = ParameterId::RatioB;
    controlMap_[19] = ParameterId::Feedback;
    controlMap_[20] = ParameterId::LevelA;
    controlMap_[21] = ParameterId::LevelB;
    controlMap_[22] = ParameterId::Mix;
    controlMap_[23] = ParameterId::Detune;
    controlMap_[24] = ParameterId::AttackA;
    controlMap_[25] = ParameterId::DecayA;
    controlMap_[26] = ParameterId::AttackB;
    controlMap_[27] = ParameterId::DecayB;
    controlMap_[28] = ParameterId::AmpAttack;
    controlMap_[29] = ParameterId::AmpDecay;
    controlMap_[30] = ParameterId::AmpSustain;
    controlMap_[31] = ParameterId::AmpRelease;
}

TriggerStatus TriggerBridge::onStepEvent(int step, int trackId,
                                         std::optional<int> note,
                                         std::optional<int> velocity,
                                         const std::vector<ParameterLock>& parameterLocks,
                                         int64_t frame) {
    if (!isValidTrack(trackId)) {
        return reject(TriggerStatus::UnknownTrack,
                      "step " + std::to_string(step) + ": unknown track " + std::to_string(trackId));
    }

    int noteValue = note.value_or(defaultNotes_[trackId]);
    int velocityValue = velocity.value_or(kDefaultVelocity);
    if (!isMidiValue(noteValue)) {
        return reject(TriggerStatus::InvalidNote,
                      "step " + std::to_string(step) + ": note " + std::to_string(noteValue) + " out of range");
    }
    if (velocityValue < 1 || velocityValue > 127) {
        return reject(TriggerStatus::InvalidVelocity,
                      "step " + std::to_string(step) + ": velocity " + std::to_string(velocityValue) + " out of range");
    }

    EngineCommand command = EngineCommand::makeNoteOn(trackId, noteValue, velocityValue, frame);
    size_t skipped = 0;
    for (const auto& lock : parameterLocks) {
        if (lock.id == ParameterId::Count || !command.addLock(lock.id, lock.value)) {
            ++skipped;
        }
    }
    if (skipped > 0) {
        // The note still plays with the locks that fit
        report(TriggerStatus::InvalidParameter,
               "step " + std::to_string(step) + ": " + std::to_string(skipped) + " parameter locks ignored");
    }
    return submit(command);
}

TriggerStatus TriggerBridge::onStepRelease(int trackId, int note, int64_t frame) {
    if (!isValidTrack(trackId)) {
        return reject(TriggerStatus::UnknownTrack, "release: unknown track " + std::to_string(trackId));
    }
    if (!isMidiValue(note)) {
        return reject(TriggerStatus::InvalidNote, "release: note " + std::to_string(note) + " out of range");
    }
    return submit(EngineCommand::makeNoteOff(trackId, note, frame));
}

TriggerStatus TriggerBridge::onExternalNoteEvent(bool noteOn, int note, int velocity, int channel) {
    int trackId = getTrackForChannel(channel);
    if (trackId < 0) {
        return reject(TriggerStatus::UnknownChannel, "MIDI channel " + std::to_string(channel) + " is not mapped");
    }
    if (!isMidiValue(note)) {
        return reject(TriggerStatus::InvalidNote, "MIDI note " + std::to_string(note) + " out of range");
    }
    if (!isMidiValue(velocity)) {
        return reject(TriggerStatus::InvalidVelocity, "MIDI velocity " + std::to_string(velocity) + " out of range");
    }

    if (!noteOn || velocity == 0) {
        return submit(EngineCommand::makeNoteOff(trackId, note));
    }
    return submit(EngineCommand::makeNoteOn(trackId, note, velocity));
}

TriggerStatus TriggerBridge::onExternalControlChange(int controller, int value, int channel) {
    if (!isMidiValue(controller) || !isMidiValue(value)) {
        return reject(TriggerStatus::InvalidParameter,
                      "CC " + std::to_string(controller) + " value " + std::to_string(value) + " out of range");
    }

    if (controller == kAllNotesOffController) {
        return allNotesOff(false);
    }
    if (controller == kAllSoundOffController) {
        return allNotesOff(true);
    }

    int trackId = getTrackForChannel(channel);
    if (trackId < 0) {
        return reject(TriggerStatus::UnknownChannel, "MIDI channel " + std::to_string(channel) + " is not mapped");
    }

    const auto& mapping = controlMap_[controller];
    if (!mapping) {
        return TriggerStatus::Ignored;
    }
    return onParameterChange(*mapping, value / 127.0f, trackId);
}

TriggerStatus TriggerBridge::onMidiMessage(const MidiMessage& message) {
    if (!message.isValid()) {
        return reject(TriggerStatus::InvalidMessage, "malformed MIDI message");
    }
    if (message.isNoteOn()) {
        return onExternalNoteEvent(true, message.getNoteNumber(), message.getVelocity(), message.getChannel());
    }
    if (message.isNoteOff()) {
        return onExternalNoteEvent(false, message.getNoteNumber(), 0, message.getChannel());
    }
    if (message.isControlChange()) {
        return onExternalControlChange(message.getControllerNumber(), message.getControllerValue(),
                                       message.getChannel());
    }
    return TriggerStatus::Ignored;
}

TriggerStatus TriggerBridge::onParameterChange(ParameterId id, float normalizedValue, int trackId,
                                               int64_t frame) {
    if (!isValidTrack(trackId)) {
        return reject(TriggerStatus::UnknownTrack, "parameter change: unknown track " + std::to_string(trackId));
    }
    if (id == ParameterId::Count) {
        return reject(TriggerStatus::InvalidParameter, "parameter change: invalid parameter id");
    }
    return submit(EngineCommand::makeSetParameter(trackId, id, normalizedValue, frame));
}

TriggerStatus TriggerBridge::onParameterSetLoaded(const ParameterSet& parameters, int trackId) {
    if (!isValidTrack(trackId)) {
        return reject(TriggerStatus::UnknownTrack, "parameter set: unknown track " + std::to_string(trackId));
    }
    return submit(EngineCommand::makeLoadParameterSet(trackId, parameters));
}

TriggerStatus TriggerBridge::allNotesOff(bool immediate) {
    return submit(EngineCommand::makeAllNotesOff(immediate));
}

void TriggerBridge::setChannelMapping(int channel, int trackId) {
    if (channel < 0 || channel >= kMidiChannels) {
        std::cerr << "TriggerBridge: Invalid MIDI channel " << channel << std::endl;
        return;
    }
    if (trackId >= 0 && !isValidTrack(trackId)) {
        std::cerr << "TriggerBridge: Cannot map channel " << channel
                  << " to unknown track " << trackId << std::endl;
        return;
    }
    channelToTrack_[channel] = trackId < 0 ? -1 : trackId;
}

int TriggerBridge::getTrackForChannel(int channel) const {
    if (channel < 0 || channel >= kMidiChannels) {
        return -1;
    }
    return channelToTrack_[channel];
}

void TriggerBridge::mapControlChange(int controller, ParameterId id) {
    if (!isMidiValue(controller) || id == ParameterId::Count ||
        controller == kAllNotesOffController || controller == kAllSoundOffController) {
        std::cerr << "TriggerBridge: Cannot map controller " << controller << std::endl;
        return;
    }
    controlMap_[controller] = id;
}

void TriggerBridge::unmapControlChange(int controller) {
    if (isMidiValue(controller)) {
        controlMap_[controller].reset();
    }
}

std::optional<ParameterId> TriggerBridge::getControlChangeMapping(int controller) const {
    if (!isMidiValue(controller)) {
        return std::nullopt;
    }
    return controlMap_[controller];
}

void TriggerBridge::setDefaultNote(int trackId, int note) {
    if (!isValidTrack(trackId) || !isMidiValue(note)) {
        std::cerr << "TriggerBridge: Invalid default note " << note << " for track " << trackId << std::endl;
        return;
    }
    defaultNotes_[trackId] = note;
}

int TriggerBridge::getDefaultNote(int trackId) const {
    return isValidTrack(trackId) ? defaultNotes_[trackId] : kDefaultNote;
}

bool TriggerBridge::isValidTrack(int trackId) const {
    return trackId >= 0 && static_cast<size_t>(trackId) < defaultNotes_.size();
}

TriggerStatus TriggerBridge::submit(const EngineCommand& command) {
    if (!engine_.enqueue(command)) {
        return reject(TriggerStatus::QueueFull, "command queue full, event dropped");
    }
    acceptedEvents_++;
    return TriggerStatus::Accepted;
}

TriggerStatus TriggerBridge::reject(TriggerStatus status, const std::string& message) {
    droppedEvents_++;
    report(status, message);
    return status;
}

void TriggerBridge::report(TriggerStatus status, const std::string& message) {
    std::cerr << "TriggerBridge: " << message << " (" << toString(status) << ")" << std::endl;
    if (diagnosticCallback_) {
        diagnosticCallback_(status, message);
    }
}

} // namespace fmcore
