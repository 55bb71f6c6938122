#include <cassert>
#include <vector>
#include "fmcore/audio/audio_buffer.h"
#include "fmcore/audio/audio_engine.h"

using namespace fmcore;

void testFormatSettings() {
    AudioEngine audio;
    assert(audio.getSampleRate() == 48000.0);
    audio.setSampleRate(44100.0);
    assert(audio.getSampleRate() == 44100.0);
    audio.setSampleRate(0.0);
    assert(audio.getSampleRate() == 44100.0);

    audio.setBufferSize(0);
    assert(audio.getBufferSize() == 1);
    audio.setOutputChannels(0);
    assert(audio.getOutputChannels() == 1);
}

void testConfiguredRateSurvivesStart() {
    AudioEngine audio;
    audio.setSampleRate(44100.0);
    audio.setBufferSize(256);
    audio.setProcessCallback([](AudioBuffer& output, size_t numFrames) {
        output.clear();
        (void)numFrames;
    });

    if (!audio.initialize() || !audio.start()) {
        // No backend or no device: the requested rate is left alone
        assert(!audio.isRunning());
        assert(audio.getSampleRate() == 44100.0);
        return;
    }
    assert(audio.isRunning());
    assert(audio.getSampleRate() > 0.0);
    assert(audio.stop());
    assert(!audio.isRunning());
}

void testSilenceWithoutStream() {
    AudioEngine audio;
    audio.setOutputChannels(2);
    std::vector<float> output(64 * 2, 1.0f);
    audio.renderInterleaved(output.data(), 64);
    for (float sample : output) {
        assert(sample == 0.0f);
    }
}

int main() {
    testFormatSettings();
    testConfiguredRateSurvivesStart();
    testSilenceWithoutStream();
    return 0;
}
