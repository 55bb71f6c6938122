#pragma once

#include <cstdint>
#include <variant>
#include "fmcore/synth/fm_drum_voice.h"
#include "fmcore/synth/fm_tone_voice.h"
#include "fmcore/synth/parameter_set.h"
#include "fmcore/synth/voice_parameters.h"

namespace fmcore {

enum class VoiceState {
    Free,
    Active,
    Releasing
};

/**
 * Note queued on a voice while its previous note fades out after a steal
 */
struct PendingNote {
    bool valid = false;
    int note = 0;
    int velocity = 0;
    int trackId = 0;
    uint64_t age = 0;
    VoiceParameters parameters;
    LockMask locks;
};

/**
 * One slot of the voice pool. Holds whichever voice machine the note's
 * parameters select and the bookkeeping the allocator steals by.
 */
class Voice {
public:
    using Machine = std::variant<FmToneVoice, FmDrumVoice>;

    explicit Voice(double sampleRate = 48000.0);

    void setSampleRate(double sampleRate);

    // Note events
    void noteOn(int note, int velocity, const VoiceParameters& parameters);
    void noteOff();
    void forceRelease(float seconds);
    void reset();

    // Live parameter update for the running machine
    void updateParameters(const VoiceParameters& parameters);

    float renderSample();
    bool isFinished() const;
    bool hasFaulted() const;

    // Bookkeeping
    VoiceState getState() const;
    bool isFree() const { return free_; }
    int getNote() const { return note_; }
    int getVelocity() const { return velocity_; }
    int getTrackId() const { return trackId_; }
    void setTrackId(int trackId) { trackId_ = trackId; }
    uint64_t getAge() const { return age_; }
    void setAge(uint64_t age) { age_ = age; }
    bool isNoteHeld() const { return noteHeld_; }

    // P-locks of the current note
    const LockMask& getLocks() const { return locks_; }
    void setLocks(const LockMask& locks) { locks_ = locks; }
    bool isLocked(ParameterId id) const { return locks_.test(parameterIndex(id)); }
    const VoiceParameters& getParameters() const { return parameters_; }

    // Steal handoff
    PendingNote& getPendingNote() { return pending_; }
    const PendingNote& getPendingNote() const { return pending_; }
    bool hasPendingNote() const { return pending_.valid; }

    MachineType getMachineType() const;
    const Machine& getMachine() const { return machine_; }

private:
    double sampleRate_;
    Machine machine_;
    VoiceParameters parameters_;
    LockMask locks_;
    PendingNote pending_;
    int note_;
    int velocity_;
    int trackId_;
    uint64_t age_;
    bool free_;
    bool noteHeld_;
    bool stolen_;
};

} // namespace fmcore
