#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include "fmcore/config/engine_config.h"
#include "fmcore/engine/engine_command.h"
#include "fmcore/synth/parameter_set.h"

namespace fmcore {

class AudioBuffer;
class VoiceAllocator;

/**
 * Snapshot of the engine's counters, readable from any thread
 */
struct EngineStatus {
    size_t activeVoices = 0;
    size_t freeVoices = 0;
    uint64_t stealCount = 0;
    uint64_t fuseCount = 0;
    uint64_t droppedCommands = 0;
    int64_t framePosition = 0;
    double lastRenderMicros = 0.0;
    double cpuLoad = 0.0;           // Render time / buffer duration
};

/**
 * Audio-thread owner of the voice pool and the per-track parameter state.
 *
 * The control thread talks to the engine only through enqueue(); process()
 * runs on the audio thread, drains the command queue at the start of every
 * buffer and applies timestamped commands at their exact frame. process()
 * never locks, allocates or logs.
 */
class SynthEngine {
public:
    static constexpr size_t kCommandQueueCapacity = 1024;
    static constexpr size_t kPendingCommandCapacity = 256;

    explicit SynthEngine(const EngineConfig& config = EngineConfig());
    ~SynthEngine();

    SynthEngine(const SynthEngine&) = delete;
    SynthEngine& operator=(const SynthEngine&) = delete;

    // Must not be called while process() is running
    void prepare(double sampleRate);

    // Control thread (single producer). Returns false if the queue is full.
    bool enqueue(const EngineCommand& command);

    // Audio thread. Renders numFrames into every channel of output.
    void process(AudioBuffer& output, size_t numFrames);

    // Any thread
    EngineStatus getStatus() const;
    int64_t getFramePosition() const;
    double getSampleRate() const;
    size_t getTrackCount() const;
    void setMasterGain(float gain);
    float getMasterGain() const;

    // Inspection while no audio thread is running (offline rendering and tests)
    VoiceAllocator& getAllocator();
    const ParameterSet& getTrackParameters(int trackId) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace fmcore
