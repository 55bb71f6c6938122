#pragma once

#include <vector>
#include <cstddef>

namespace fmcore {

/**
 * Planar multi-channel sample buffer. Sized once up front; nothing here
 * allocates after construction.
 */
class AudioBuffer {
public:
    AudioBuffer(size_t numChannels, size_t numFrames);
    ~AudioBuffer() = default;

    // Buffer properties
    size_t getNumChannels() const { return numChannels_; }
    size_t getNumFrames() const { return numFrames_; }

    // Data access
    float* getWritePointer(size_t channel);
    const float* getReadPointer(size_t channel) const;

    // Buffer operations
    void clear();
    void fill(float value);
    void copyChannel(size_t source, size_t destination, size_t numFrames);

    // Writes numFrames frames as L, R, L, R, ... into numChannels channels.
    // Channels this buffer does not have are written as silence.
    void copyToInterleaved(float* destination, size_t numChannels, size_t numFrames) const;

    float getPeakLevel(size_t channel, size_t numFrames) const;

private:
    size_t numChannels_;
    size_t numFrames_;
    std::vector<std::vector<float>> channels_;
};

} // namespace fmcore
