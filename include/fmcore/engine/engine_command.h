#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include "fmcore/synth/parameter_set.h"

namespace fmcore {

constexpr size_t kMaxLocksPerNote = 16;

enum class CommandType : uint8_t {
    NoteOn,
    NoteOff,
    SetParameter,
    LoadParameterSet,
    AllNotesOff,        // Release every voice
    AllSoundOff         // Silence every voice immediately
};

/**
 * Message from the control thread to the audio thread.
 *
 * frame is an absolute sample position on the engine's timeline. A negative
 * frame, or one that has already passed, applies at the start of the next
 * rendered buffer.
 */
struct EngineCommand {
    CommandType type = CommandType::NoteOn;
    int trackId = 0;
    int note = 60;
    int velocity = 100;
    ParameterId parameter = ParameterId::Algorithm;
    float value = 0.0f;
    int64_t frame = -1;

    // NoteOn payload
    uint8_t lockCount = 0;
    std::array<ParameterLock, kMaxLocksPerNote> locks{};

    // LoadParameterSet payload
    ParameterSet parameters;

    bool addLock(ParameterId id, float normalizedValue) {
        if (lockCount >= kMaxLocksPerNote) {
            return false;
        }
        locks[lockCount++] = ParameterLock{id, normalizedValue};
        return true;
    }

    static EngineCommand makeNoteOn(int trackId, int note, int velocity, int64_t frame = -1) {
        EngineCommand command;
        command.type = CommandType::NoteOn;
        command.trackId = trackId;
        command.note = note;
        command.velocity = velocity;
        command.frame = frame;
        return command;
    }

    static EngineCommand makeNoteOff(int trackId, int note, int64_t frame = -1) {
        EngineCommand command;
        command.type = CommandType::NoteOff;
        command.trackId = trackId;
        command.note = note;
        command.frame = frame;
        return command;
    }

    static EngineCommand makeSetParameter(int trackId, ParameterId id, float normalizedValue,
                                          int64_t frame = -1) {
        EngineCommand command;
        command.type = CommandType::SetParameter;
        command.trackId = trackId;
        command.parameter = id;
        command.value = normalizedValue;
        command.frame = frame;
        return command;
    }

    static EngineCommand makeLoadParameterSet(int trackId, const ParameterSet& parameters) {
        EngineCommand command;
        command.type = CommandType::LoadParameterSet;
        command.trackId = trackId;
        command.parameters = parameters;
        return command;
    }

    static EngineCommand makeAllNotesOff(bool immediate = false) {
        EngineCommand command;
        command.type = immediate ? CommandType::AllSoundOff : CommandType::AllNotesOff;
        return command;
    }
};

} // namespace fmcore
