#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace fmcore {

class AudioBuffer;

/**
 * PortAudio output driver.
 *
 * Owns the output stream and a preallocated planar buffer. Each PortAudio
 * callback is rendered in chunks of at most getBufferSize() frames through
 * the process callback and interleaved into the device buffer.
 */
class AudioEngine {
public:
    AudioEngine();
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    // Initialization
    bool initialize();
    void shutdown();

    // Engine control
    bool start();
    bool stop();
    bool isRunning() const;

    // Stream format, only changeable while stopped. If the device refuses the
    // requested sample rate, start() falls back to the device's default rate.
    void setSampleRate(double sampleRate);
    double getSampleRate() const;
    void setBufferSize(size_t bufferSize);
    size_t getBufferSize() const;
    void setOutputChannels(size_t numChannels);
    size_t getOutputChannels() const;

    // Runs on the audio thread; set before start()
    using ProcessCallback = std::function<void(AudioBuffer& output, size_t numFrames)>;
    void setProcessCallback(ProcessCallback callback);

    // Called from the PortAudio callback
    void renderInterleaved(float* output, size_t numFrames);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace fmcore
