#include "fmcore/engine/synth_engine.h"
#include "fmcore/audio/audio_buffer.h"
#include "fmcore/engine/control_queue.h"
#include "fmcore/synth/parameter_mapper.h"
#include "fmcore/synth/voice_allocator.h"
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <vector>

namespace fmcore {

class SynthEngine::Impl {
public:
    explicit Impl(const EngineConfig& config)
        : sampleRate(config.sampleRate)
        , allocator(config.polyphony, config.sampleRate)
        , trackSets(std::max<size_t>(config.trackCount, 1))
        , trackParameters(trackSets.size(), ParameterMapper::resolve(ParameterSet()))
        , masterGain(config.masterGain)
    {
        allocator.setStealFadeTime(config.stealFadeMs / 1000.0f);
        for (size_t i = 0; i < kPendingCommandCapacity; ++i) {
            freeSlots[i] = static_cast<uint16_t>(kPendingCommandCapacity - 1 - i);
        }
        freeCount = kPendingCommandCapacity;
    }

    double sampleRate;
    VoiceAllocator allocator;
    std::vector<ParameterSet> trackSets;
    std::vector<VoiceParameters> trackParameters;
    SpscQueue<EngineCommand, kCommandQueueCapacity> queue;

    // Commands waiting for their frame. order holds slot indices sorted by
    // frame, latest first, so the next due command sits at the back.
    std::array<EngineCommand, kPendingCommandCapacity> pendingSlots;
    std::array<uint16_t, kPendingCommandCapacity> order{};
    std::array<uint16_t, kPendingCommandCapacity> freeSlots{};
    size_t pendingCount = 0;
    size_t freeCount = 0;
    EngineCommand scratch;

    std::atomic<float> masterGain;
    std::atomic<int64_t> framePosition{0};
    std::atomic<uint64_t> droppedCommands{0};
    std::atomic<uint64_t> stealCount{0};
    std::atomic<uint64_t> fuseCount{0};
    std::atomic<size_t> activeVoices{0};
    std::atomic<double> lastRenderMicros{0.0};
    std::atomic<double> cpuLoad{0.0};

    bool isValidTrack(int trackId) const {
        return trackId >= 0 && static_cast<size_t>(trackId) < trackSets.size();
    }

    // Returns true when the pending list filled up with commands still queued.
    // Those stay in the queue, in order, until applied commands free a slot.
    bool drainQueue(int64_t now) {
        while (freeCount > 0 && queue.pop(scratch)) {
            if (scratch.frame < now) {
                scratch.frame = now;
            }
            insertPending(scratch);
        }
        return freeCount == 0 && !queue.empty();
    }

    void insertPending(const EngineCommand& command) {
        uint16_t slot = freeSlots[--freeCount];
        pendingSlots[slot] = command;

        // Equal frames keep arrival order: the newer command goes further
        // from the back than the ones already queued.
        size_t position = 0;
        while (position < pendingCount && pendingSlots[order[position]].frame > command.frame) {
            ++position;
        }
        for (size_t i = pendingCount; i > position; --i) {
            order[i] = order[i - 1];
        }
        order[position] = slot;
        ++pendingCount;
    }

    bool hasDueCommand(int64_t frame) const {
        return pendingCount > 0 && pendingSlots[order[pendingCount - 1]].frame <= frame;
    }

    int64_t nextPendingFrame() const {
        return pendingSlots[order[pendingCount - 1]].frame;
    }

    void applyNextPending() {
        uint16_t slot = order[--pendingCount];
        apply(pendingSlots[slot]);
        freeSlots[freeCount++] = slot;
    }

    void apply(const EngineCommand& command) {
        switch (command.type) {
            case CommandType::NoteOn:
                applyNoteOn(command);
                break;
            case CommandType::NoteOff:
                allocator.release(command.trackId, command.note);
                break;
            case CommandType::SetParameter:
                applySetParameter(command);
                break;
            case CommandType::LoadParameterSet:
                applyParameterSet(command);
                break;
            case CommandType::AllNotesOff:
                allocator.releaseAll();
                break;
            case CommandType::AllSoundOff:
                allocator.resetAll();
                break;
        }
    }

    void applyNoteOn(const EngineCommand& command) {
        if (!isValidTrack(command.trackId) ||
            command.note < 0 || command.note > 127 ||
            command.velocity < 1 || command.velocity > 127) {
            droppedCommands.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        VoiceParameters parameters = trackParameters[command.trackId];
        LockMask locks;
        size_t lockCount = std::min<size_t>(command.lockCount, kMaxLocksPerNote);
        for (size_t i = 0; i < lockCount; ++i) {
            const ParameterLock& lock = command.locks[i];
            if (lock.id == ParameterId::Count) {
                continue;
            }
            ParameterMapper::apply(lock.id, lock.value, parameters);
            locks.set(parameterIndex(lock.id));
        }
        allocator.trigger(command.note, command.velocity, command.trackId, parameters, locks);
    }

    void applySetParameter(const EngineCommand& command) {
        if (!isValidTrack(command.trackId) || command.parameter == ParameterId::Count) {
            droppedCommands.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        ParameterId id = command.parameter;
        ParameterSet& set = trackSets[command.trackId];
        set.set(id, command.value);
        float value = set.get(id);
        ParameterMapper::apply(id, value, trackParameters[command.trackId]);

        for (size_t i = 0; i < allocator.getPolyphony(); ++i) {
            Voice& voice = allocator.getVoice(i);
            if (voice.isFree()) {
                continue;
            }
            if (voice.getTrackId() == command.trackId && !voice.isLocked(id)) {
                VoiceParameters parameters = voice.getParameters();
                ParameterMapper::apply(id, value, parameters);
                voice.updateParameters(parameters);
            }
            PendingNote& pending = voice.getPendingNote();
            if (pending.valid && pending.trackId == command.trackId &&
                !pending.locks.test(parameterIndex(id))) {
                ParameterMapper::apply(id, value, pending.parameters);
            }
        }
    }

    void applyParameterSet(const EngineCommand& command) {
        if (!isValidTrack(command.trackId)) {
            droppedCommands.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        const ParameterSet& set = command.parameters;
        trackSets[command.trackId] = set;
        trackParameters[command.trackId] = ParameterMapper::resolve(set);

        for (size_t i = 0; i < allocator.getPolyphony(); ++i) {
            Voice& voice = allocator.getVoice(i);
            if (voice.isFree()) {
                continue;
            }
            if (voice.getTrackId() == command.trackId) {
                VoiceParameters parameters = voice.getParameters();
                mergeUnlocked(set, voice.getLocks(), parameters);
                voice.updateParameters(parameters);
            }
            PendingNote& pending = voice.getPendingNote();
            if (pending.valid && pending.trackId == command.trackId) {
                mergeUnlocked(set, pending.locks, pending.parameters);
            }
        }
    }

    static void mergeUnlocked(const ParameterSet& set, const LockMask& locks,
                              VoiceParameters& target) {
        for (size_t i = 0; i < kParameterCount; ++i) {
            if (!locks.test(i)) {
                auto id = static_cast<ParameterId>(i);
                ParameterMapper::apply(id, set.get(id), target);
            }
        }
    }

    void render(float* out, size_t begin, size_t end) {
        float gain = masterGain.load(std::memory_order_relaxed);
        for (size_t i = begin; i < end; ++i) {
            out[i] = std::tanh(allocator.renderAll() * gain);
        }
    }

    void publishStatus(double renderMicros, size_t numFrames) {
        stealCount.store(allocator.getStealCount(), std::memory_order_relaxed);
        fuseCount.store(allocator.getFuseCount(), std::memory_order_relaxed);
        activeVoices.store(allocator.getActiveVoiceCount(), std::memory_order_relaxed);
        lastRenderMicros.store(renderMicros, std::memory_order_relaxed);
        double bufferMicros = numFrames * 1.0e6 / sampleRate;
        cpuLoad.store(bufferMicros > 0.0 ? renderMicros / bufferMicros : 0.0,
                      std::memory_order_relaxed);
    }
};

SynthEngine::SynthEngine(const EngineConfig& config)
    : pImpl(std::make_unique<Impl>(config))
{
}

SynthEngine::~SynthEngine() = default;

void SynthEngine::prepare(double sampleRate) {
    if (!(sampleRate > 0.0)) {
        return;
    }
    pImpl->sampleRate = sampleRate;
    pImpl->allocator.setSampleRate(sampleRate);
}

bool SynthEngine::enqueue(const EngineCommand& command) {
    if (!pImpl->queue.push(command)) {
        pImpl->droppedCommands.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void SynthEngine::process(AudioBuffer& output, size_t numFrames) {
    auto startTime = std::chrono::steady_clock::now();

    Impl& impl = *pImpl;
    const size_t frames = std::min(numFrames, output.getNumFrames());
    const int64_t bufferStart = impl.framePosition.load(std::memory_order_relaxed);

    bool backlog = impl.drainQueue(bufferStart);

    float* mono = output.getWritePointer(0);
    size_t frame = 0;
    while (frame < frames) {
        const int64_t now = bufferStart + static_cast<int64_t>(frame);
        while (impl.hasDueCommand(now)) {
            impl.applyNextPending();
            if (backlog && impl.freeCount > 0) {
                backlog = impl.drainQueue(now);
            }
        }

        size_t segmentEnd = frames;
        if (impl.pendingCount > 0) {
            int64_t next = impl.nextPendingFrame() - bufferStart;
            if (next < static_cast<int64_t>(segmentEnd)) {
                segmentEnd = static_cast<size_t>(next);
            }
        }

        if (mono) {
            impl.render(mono, frame, segmentEnd);
        } else {
            for (size_t i = frame; i < segmentEnd; ++i) {
                impl.allocator.renderAll();
            }
        }
        frame = segmentEnd;
    }

    for (size_t channel = 1; channel < output.getNumChannels(); ++channel) {
        output.copyChannel(0, channel, frames);
    }

    impl.framePosition.store(bufferStart + static_cast<int64_t>(frames), std::memory_order_relaxed);

    auto elapsed = std::chrono::steady_clock::now() - startTime;
    double micros = std::chrono::duration<double, std::micro>(elapsed).count();
    impl.publishStatus(micros, frames);
}

EngineStatus SynthEngine::getStatus() const {
    EngineStatus status;
    status.activeVoices = pImpl->activeVoices.load(std::memory_order_relaxed);
    status.freeVoices = pImpl->allocator.getPolyphony() - status.activeVoices;
    status.stealCount = pImpl->stealCount.load(std::memory_order_relaxed);
    status.fuseCount = pImpl->fuseCount.load(std::memory_order_relaxed);
    status.droppedCommands = pImpl->droppedCommands.load(std::memory_order_relaxed);
    status.framePosition = pImpl->framePosition.load(std::memory_order_relaxed);
    status.lastRenderMicros = pImpl->lastRenderMicros.load(std::memory_order_relaxed);
    status.cpuLoad = pImpl->cpuLoad.load(std::memory_order_relaxed);
    return status;
}

int64_t SynthEngine::getFramePosition() const {
    return pImpl->framePosition.load(std::memory_order_relaxed);
}

double SynthEngine::getSampleRate() const {
    return pImpl->sampleRate;
}

size_t SynthEngine::getTrackCount() const {
    return pImpl->trackSets.size();
}

void SynthEngine::setMasterGain(float gain) {
    if (std::isnan(gain)) {
        return;
    }
    pImpl->masterGain.store(std::clamp(gain, 0.0f, 2.0f), std::memory_order_relaxed);
}

float SynthEngine::getMasterGain() const {
    return pImpl->masterGain.load(std::memory_order_relaxed);
}

VoiceAllocator& SynthEngine::getAllocator() {
    return pImpl->allocator;
}

const ParameterSet& SynthEngine::getTrackParameters(int trackId) const {
    size_t index = trackId < 0 ? 0 : std::min<size_t>(trackId, pImpl->trackSets.size() - 1);
    return pImpl->trackSets[index];
}

} // namespace fmcore
