#include "fmcore/audio/audio_buffer.h"
#include <algorithm>
#include <cmath>

namespace fmcore {

AudioBuffer::AudioBuffer(size_t numChannels, size_t numFrames)
    : numChannels_(numChannels)
    , numFrames_(numFrames)
    , channels_(numChannels)
{
    for (auto& channel : channels_) {
        channel.resize(numFrames, 0.0f);
    }
}

float* AudioBuffer::getWritePointer(size_t channel) {
    if (channel >= numChannels_) {
        return nullptr;
    }
    return channels_[channel].data();
}

const float* AudioBuffer::getReadPointer(size_t channel) const {
    if (channel >= numChannels_) {
        return nullptr;
    }
    return channels_[channel].data();
}

void AudioBuffer::clear() {
    fill(0.0f);
}

void AudioBuffer::fill(float value) {
    for (auto& channel : channels_) {
        std::fill(channel.begin(), channel.end(), value);
    }
}

void AudioBuffer::copyChannel(size_t source, size_t destination, size_t numFrames) {
    if (source >= numChannels_ || destination >= numChannels_ || source == destination) {
        return;
    }
    size_t count = std::min(numFrames, numFrames_);
    std::copy(channels_[source].begin(), channels_[source].begin() + count,
              channels_[destination].begin());
}

void AudioBuffer::copyToInterleaved(float* destination, size_t numChannels, size_t numFrames) const {
    size_t count = std::min(numFrames, numFrames_);
    for (size_t i = 0; i < count; ++i) {
        for (size_t ch = 0; ch < numChannels; ++ch) {
            destination[i * numChannels + ch] = ch < numChannels_ ? channels_[ch][i] : 0.0f;
        }
    }
    // Frames beyond this buffer are silent
    std::fill(destination + count * numChannels, destination + numFrames * numChannels, 0.0f);
}

float AudioBuffer::getPeakLevel(size_t channel, size_t numFrames) const {
    if (channel >= numChannels_) {
        return 0.0f;
    }
    size_t count = std::min(numFrames, numFrames_);
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        peak = std::max(peak, std::fabs(channels_[channel][i]));
    }
    return peak;
}

} // namespace fmcore
