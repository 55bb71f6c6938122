#include "fmcore/synth/voice_allocator.h"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace fmcore {

namespace {
constexpr float kDefaultStealFade = 0.005f;
}

VoiceAllocator::VoiceAllocator(size_t polyphony, double sampleRate)
    : voices_(std::max<size_t>(polyphony, 1), Voice(sampleRate))
    , nextAge_(0)
    , stealFadeTime_(kDefaultStealFade)
    , stealCount_(0)
    , fuseCount_(0)
{
}

void VoiceAllocator::setSampleRate(double sampleRate) {
    for (auto& voice : voices_) {
        voice.setSampleRate(sampleRate);
    }
}

void VoiceAllocator::setStealFadeTime(float seconds) {
    stealFadeTime_ = std::max(seconds, 0.0f);
}

VoiceHandle VoiceAllocator::trigger(int note, int velocity, int trackId,
                                    const VoiceParameters& parameters,
                                    const LockMask& locks) {
    // Retriggering a held note on the same track releases the previous voice
    release(trackId, note);

    VoiceHandle handle;
    handle.age = ++nextAge_;

    int index = findFreeVoice();
    if (index >= 0) {
        Voice& voice = voices_[index];
        voice.setTrackId(trackId);
        voice.setAge(handle.age);
        voice.setLocks(locks);
        voice.noteOn(note, velocity, parameters);
        handle.index = index;
        return handle;
    }

    index = chooseVictim();
    Voice& victim = voices_[index];
    bool alreadyFading = victim.hasPendingNote();

    PendingNote& pending = victim.getPendingNote();
    pending.valid = true;
    pending.note = note;
    pending.velocity = velocity;
    pending.trackId = trackId;
    pending.age = handle.age;
    pending.parameters = parameters;
    pending.locks = locks;

    if (!alreadyFading) {
        victim.forceRelease(stealFadeTime_);
    }
    stealCount_++;

    handle.index = index;
    handle.stolen = true;
    return handle;
}

void VoiceAllocator::release(int trackId, int note) {
    for (auto& voice : voices_) {
        if (voice.isFree()) {
            continue;
        }
        PendingNote& pending = voice.getPendingNote();
        if (pending.valid && pending.trackId == trackId && pending.note == note) {
            pending.valid = false;
        }
        if (voice.isNoteHeld() && voice.getTrackId() == trackId && voice.getNote() == note) {
            voice.noteOff();
        }
    }
}

void VoiceAllocator::releaseTrack(int trackId) {
    for (auto& voice : voices_) {
        if (voice.isFree() || voice.getTrackId() != trackId) {
            continue;
        }
        voice.getPendingNote().valid = false;
        if (voice.isNoteHeld()) {
            voice.noteOff();
        }
    }
}

void VoiceAllocator::releaseAll() {
    for (auto& voice : voices_) {
        if (voice.isFree()) {
            continue;
        }
        voice.getPendingNote().valid = false;
        if (voice.isNoteHeld()) {
            voice.noteOff();
        }
    }
}

void VoiceAllocator::resetAll() {
    for (auto& voice : voices_) {
        voice.reset();
    }
}

float VoiceAllocator::renderAll() {
    float sum = 0.0f;
    for (auto& voice : voices_) {
        if (voice.isFree()) {
            continue;
        }

        float sample = voice.renderSample();
        if (voice.hasFaulted() || !std::isfinite(sample)) {
            // Last-resort fuse: silence and recycle the voice
            voice.reset();
            fuseCount_++;
            continue;
        }
        sum += sample;

        if (voice.isFinished()) {
            if (voice.hasPendingNote()) {
                startPendingNote(voice);
            } else {
                voice.reset();
            }
        }
    }
    return sum;
}

size_t VoiceAllocator::getActiveVoiceCount() const {
    return static_cast<size_t>(std::count_if(voices_.begin(), voices_.end(),
        [](const Voice& voice) { return !voice.isFree(); }));
}

int VoiceAllocator::findFreeVoice() const {
    for (size_t i = 0; i < voices_.size(); ++i) {
        if (voices_[i].isFree()) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int VoiceAllocator::chooseVictim() const {
    // Lowest key wins: not already being stolen, releasing, oldest, quietest
    auto rank = [](const Voice& voice) {
        int pending = voice.hasPendingNote() ? 1 : 0;
        int held = voice.getState() == VoiceState::Releasing ? 0 : 1;
        return std::make_tuple(pending, held, voice.getAge(), voice.getVelocity());
    };

    size_t best = 0;
    for (size_t i = 1; i < voices_.size(); ++i) {
        if (rank(voices_[i]) < rank(voices_[best])) {
            best = i;
        }
    }
    return static_cast<int>(best);
}

void VoiceAllocator::startPendingNote(Voice& voice) {
    PendingNote next = voice.getPendingNote();
    voice.reset();
    voice.setTrackId(next.trackId);
    voice.setAge(next.age);
    voice.setLocks(next.locks);
    voice.noteOn(next.note, next.velocity, next.parameters);
}

} // namespace fmcore
