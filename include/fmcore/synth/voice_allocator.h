#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "fmcore/synth/voice.h"

namespace fmcore {

/**
 * Result of a trigger: the pool slot that will play the note
 */
struct VoiceHandle {
    int index = -1;
    uint64_t age = 0;
    bool stolen = false;

    bool isValid() const { return index >= 0; }
};

/**
 * Polyphony manager over a fixed, preallocated pool of voices.
 *
 * A free voice is preferred. When the pool is full a voice is stolen:
 * releasing voices before held ones, then the oldest, then the quietest.
 * The stolen voice fades out over the steal fade time and starts the new note
 * on the sample after the fade completes.
 */
class VoiceAllocator {
public:
    explicit VoiceAllocator(size_t polyphony = 8, double sampleRate = 48000.0);

    void setSampleRate(double sampleRate);
    void setStealFadeTime(float seconds);
    float getStealFadeTime() const { return stealFadeTime_; }

    // Control
    VoiceHandle trigger(int note, int velocity, int trackId,
                        const VoiceParameters& parameters,
                        const LockMask& locks = LockMask());
    void release(int trackId, int note);
    void releaseTrack(int trackId);
    void releaseAll();
    void resetAll();

    // Rendering
    float renderAll();

    // Status
    size_t getPolyphony() const { return voices_.size(); }
    size_t getActiveVoiceCount() const;
    size_t getFreeVoiceCount() const { return getPolyphony() - getActiveVoiceCount(); }
    uint64_t getStealCount() const { return stealCount_; }
    uint64_t getFuseCount() const { return fuseCount_; }

    Voice& getVoice(size_t index) { return voices_[index]; }
    const Voice& getVoice(size_t index) const { return voices_[index]; }

    template <typename Fn>
    void forEachVoiceOnTrack(int trackId, Fn&& fn) {
        for (auto& voice : voices_) {
            if (!voice.isFree() && voice.getTrackId() == trackId) {
                fn(voice);
            }
        }
    }

private:
    int findFreeVoice() const;
    int chooseVictim() const;
    void startPendingNote(Voice& voice);

    std::vector<Voice> voices_;
    uint64_t nextAge_;
    float stealFadeTime_;
    uint64_t stealCount_;
    uint64_t fuseCount_;
};

} // namespace fmcore
