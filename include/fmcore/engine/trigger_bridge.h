#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "fmcore/engine/engine_command.h"
#include "fmcore/synth/parameter_set.h"

namespace fmcore {

class MidiMessage;
class SynthEngine;

/**
 * Outcome of a bridge call. Everything other than Accepted and Ignored means
 * the event was dropped.
 */
enum class TriggerStatus {
    Accepted,
    Ignored,            // Well-formed but nothing to do (unmapped controller, ...)
    InvalidNote,
    InvalidVelocity,
    InvalidParameter,
    UnknownTrack,
    UnknownChannel,
    InvalidMessage,
    QueueFull
};

const char* toString(TriggerStatus status);

/**
 * Turns sequencer steps, MIDI input and parameter edits into engine commands.
 *
 * Runs on the control thread and is the only producer of the engine's command
 * queue. Malformed events are dropped, counted and reported on std::cerr and
 * through the optional diagnostic callback.
 */
class TriggerBridge {
public:
    static constexpr int kMidiChannels = 16;
    static constexpr int kDefaultNote = 60;
    static constexpr int kDefaultVelocity = 100;

    using DiagnosticCallback = std::function<void(TriggerStatus status, const std::string& message)>;

    explicit TriggerBridge(SynthEngine& engine);

    // Sequencer
    TriggerStatus onStepEvent(int step, int trackId,
                              std::optional<int> note,
                              std::optional<int> velocity,
                              const std::vector<ParameterLock>& parameterLocks = {},
                              int64_t frame = -1);
    TriggerStatus onStepRelease(int trackId, int note, int64_t frame = -1);

    // External MIDI
    TriggerStatus onExternalNoteEvent(bool noteOn, int note, int velocity, int channel);
    TriggerStatus onExternalControlChange(int controller, int value, int channel);
    TriggerStatus onMidiMessage(const MidiMessage& message);

    // Automation and presets
    TriggerStatus onParameterChange(ParameterId id, float normalizedValue, int trackId,
                                    int64_t frame = -1);
    TriggerStatus onParameterSetLoaded(const ParameterSet& parameters, int trackId);
    TriggerStatus allNotesOff(bool immediate = false);

    // MIDI channel (0-based) to track routing. trackId -1 unmaps the channel.
    void setChannelMapping(int channel, int trackId);
    int getTrackForChannel(int channel) const;

    // Controller routing. The all-notes-off (123) and all-sound-off (120)
    // controllers are always handled and cannot be remapped.
    void mapControlChange(int controller, ParameterId id);
    void unmapControlChange(int controller);
    std::optional<ParameterId> getControlChangeMapping(int controller) const;

    // Note used by step events that carry none
    void setDefaultNote(int trackId, int note);
    int getDefaultNote(int trackId) const;

    void setDiagnosticCallback(DiagnosticCallback callback) { diagnosticCallback_ = callback; }
    uint64_t getDroppedEventCount() const { return droppedEvents_; }
    uint64_t getAcceptedEventCount() const { return acceptedEvents_; }

private:
    bool isValidTrack(int trackId) const;
    TriggerStatus submit(const EngineCommand& command);
    TriggerStatus reject(TriggerStatus status, const std::string& message);
    void report(TriggerStatus status, const std::string& message);

    SynthEngine& engine_;
    std::array<int, kMidiChannels> channelToTrack_;
    std::array<std::optional<ParameterId>, 128> controlMap_;
    std::vector<int> defaultNotes_;
    DiagnosticCallback diagnosticCallback_;
    uint64_t droppedEvents_;
    uint64_t acceptedEvents_;
};

} // namespace fmcore
