#include "fmcore/audio/audio_engine.h"
#include "fmcore/audio/audio_buffer.h"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

#ifdef FMCORE_USE_PORTAUDIO
#include <portaudio.h>
#endif

namespace fmcore {

class AudioEngine::Impl {
public:
    double sampleRate = 48000.0;
    size_t bufferSize = 512;
    size_t outputChannels = 2;
    bool initialized = false;
    bool running = false;
    ProcessCallback processCallback;
    std::unique_ptr<AudioBuffer> outputBuffer;

#ifdef FMCORE_USE_PORTAUDIO
    PaStream* stream = nullptr;
#endif

    void allocateBuffer() {
        outputBuffer = std::make_unique<AudioBuffer>(outputChannels, bufferSize);
    }
};

AudioEngine::AudioEngine() : pImpl(std::make_unique<Impl>()) {
}

AudioEngine::~AudioEngine() {
    shutdown();
}

bool AudioEngine::initialize() {
    if (pImpl->initialized) {
        return true;
    }
#ifdef FMCORE_USE_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "AudioEngine: PortAudio initialization failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    pImpl->initialized = true;
    std::cout << "AudioEngine: Initialized with PortAudio" << std::endl;
    return true;
#else
    std::cerr << "AudioEngine: No audio backend (PortAudio not found)" << std::endl;
    return false;
#endif
}

void AudioEngine::shutdown() {
    if (pImpl->running) {
        stop();
    }
#ifdef FMCORE_USE_PORTAUDIO
    if (pImpl->initialized) {
        PaError err = Pa_Terminate();
        if (err != paNoError) {
            std::cerr << "AudioEngine: PortAudio termination error: " << Pa_GetErrorText(err) << std::endl;
        }
    }
#endif
    pImpl->initialized = false;
}

} // namespace fmcore

#ifdef FMCORE_USE_PORTAUDIO
// PortAudio needs a plain C callback in the global namespace
extern "C" int fmcoreAudioCallback(const void* inputBuffer, void* outputBuffer,
                                   unsigned long framesPerBuffer,
                                   const PaStreamCallbackTimeInfo* timeInfo,
                                   PaStreamCallbackFlags statusFlags,
                                   void* userData) {
    (void)inputBuffer;
    (void)timeInfo;
    (void)statusFlags;

    auto* engine = static_cast<fmcore::AudioEngine*>(userData);
    if (!outputBuffer || framesPerBuffer == 0 || !engine) {
        return paContinue;
    }
    engine->renderInterleaved(static_cast<float*>(outputBuffer), framesPerBuffer);
    return paContinue;
}
#endif

namespace fmcore {

bool AudioEngine::start() {
    if (pImpl->running) {
        return true;
    }

#ifdef FMCORE_USE_PORTAUDIO
    if (!pImpl->initialized) {
        std::cerr << "AudioEngine: Cannot start, not initialized" << std::endl;
        return false;
    }
    if (!pImpl->processCallback) {
        std::cerr << "AudioEngine: Cannot start, no process callback set" << std::endl;
        return false;
    }

    // Prefer PulseAudio/PipeWire, then JACK, then ALSA
    int numHostApis = Pa_GetHostApiCount();
    PaHostApiIndex pulseApiIndex = -1;
    PaHostApiIndex jackApiIndex = -1;
    PaHostApiIndex alsaApiIndex = -1;
    for (int i = 0; i < numHostApis; ++i) {
        const PaHostApiInfo* apiInfo = Pa_GetHostApiInfo(i);
        if (!apiInfo) {
            continue;
        }
        std::string apiName = apiInfo->name;
        if (apiName.find("Pulse") != std::string::npos ||
            apiName.find("PipeWire") != std::string::npos) {
            pulseApiIndex = i;
        } else if (apiName.find("JACK") != std::string::npos) {
            jackApiIndex = i;
        } else if (apiName.find("ALSA") != std::string::npos) {
            alsaApiIndex = i;
        }
    }

    PaHostApiIndex preferredApi = pulseApiIndex >= 0 ? pulseApiIndex
                                : jackApiIndex >= 0 ? jackApiIndex
                                : alsaApiIndex >= 0 ? alsaApiIndex
                                : Pa_GetDefaultHostApi();
    const PaHostApiInfo* hostApi = Pa_GetHostApiInfo(preferredApi);
    if (!hostApi) {
        std::cerr << "AudioEngine: No suitable host API found" << std::endl;
        return false;
    }

    PaStreamParameters outputParameters;
    outputParameters.device = hostApi->defaultOutputDevice;
    if (outputParameters.device == paNoDevice) {
        outputParameters.device = Pa_GetDefaultOutputDevice();
    }
    if (outputParameters.device == paNoDevice) {
        std::cerr << "AudioEngine: No default output device found" << std::endl;
        return false;
    }

    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(outputParameters.device);
    if (deviceInfo->maxOutputChannels > 0) {
        pImpl->outputChannels = std::min<size_t>(pImpl->outputChannels,
                                                 static_cast<size_t>(deviceInfo->maxOutputChannels));
    }
    std::cout << "AudioEngine: Host API " << hostApi->name << ", device " << deviceInfo->name << std::endl;

    outputParameters.channelCount = static_cast<int>(pImpl->outputChannels);
    outputParameters.sampleFormat = paFloat32;
    outputParameters.suggestedLatency = deviceInfo->defaultLowOutputLatency;
    outputParameters.hostApiSpecificStreamInfo = nullptr;

    // Requested rate first, the device's own rate only if it is refused.
    // The configured rate changes only once the stream is running.
    double streamRate = pImpl->sampleRate;
    if (Pa_IsFormatSupported(nullptr, &outputParameters, streamRate) != paFormatIsSupported) {
        if (deviceInfo->defaultSampleRate <= 0) {
            std::cerr << "AudioEngine: Sample rate " << streamRate
                      << " Hz not supported by " << deviceInfo->name << std::endl;
            return false;
        }
        std::cout << "AudioEngine: " << streamRate << " Hz not supported, using "
                  << deviceInfo->defaultSampleRate << " Hz" << std::endl;
        streamRate = deviceInfo->defaultSampleRate;
    }

    pImpl->allocateBuffer();

    PaError err = Pa_OpenStream(
        &pImpl->stream,
        nullptr,  // Output only
        &outputParameters,
        streamRate,
        static_cast<unsigned long>(pImpl->bufferSize),
        paClipOff,
        fmcoreAudioCallback,
        this
    );
    if (err != paNoError) {
        std::cerr << "AudioEngine: Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        pImpl->stream = nullptr;
        return false;
    }

    err = Pa_StartStream(pImpl->stream);
    if (err != paNoError) {
        std::cerr << "AudioEngine: Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        Pa_CloseStream(pImpl->stream);
        pImpl->stream = nullptr;
        return false;
    }

    const PaStreamInfo* streamInfo = Pa_GetStreamInfo(pImpl->stream);
    pImpl->sampleRate = streamRate;
    pImpl->running = true;
    std::cout << "AudioEngine: Started (Sample Rate: " << pImpl->sampleRate
              << ", Buffer Size: " << pImpl->bufferSize
              << ", Channels: " << pImpl->outputChannels;
    if (streamInfo) {
        std::cout << ", Latency: " << streamInfo->outputLatency * 1000.0 << " ms";
    }
    std::cout << ")" << std::endl;
    return true;
#else
    std::cerr << "AudioEngine: Cannot start, no audio backend (PortAudio not found)" << std::endl;
    return false;
#endif
}

bool AudioEngine::stop() {
    if (!pImpl->running) {
        return true;
    }

#ifdef FMCORE_USE_PORTAUDIO
    if (pImpl->stream) {
        PaError err = Pa_StopStream(pImpl->stream);
        if (err != paNoError && err != paStreamIsStopped) {
            std::cerr << "AudioEngine: Error stopping stream: " << Pa_GetErrorText(err) << std::endl;
        }
        err = Pa_CloseStream(pImpl->stream);
        if (err != paNoError) {
            std::cerr << "AudioEngine: Error closing stream: " << Pa_GetErrorText(err) << std::endl;
        }
        pImpl->stream = nullptr;
    }
#endif

    pImpl->running = false;
    std::cout << "AudioEngine: Stopped" << std::endl;
    return true;
}

bool AudioEngine::isRunning() const {
    return pImpl->running;
}

void AudioEngine::setSampleRate(double sampleRate) {
    if (pImpl->running) {
        std::cerr << "AudioEngine: Cannot change sample rate while running" << std::endl;
        return;
    }
    if (sampleRate > 0.0) {
        pImpl->sampleRate = sampleRate;
    }
}

double AudioEngine::getSampleRate() const {
    return pImpl->sampleRate;
}

void AudioEngine::setBufferSize(size_t bufferSize) {
    if (pImpl->running) {
        std::cerr << "AudioEngine: Cannot change buffer size while running" << std::endl;
        return;
    }
    pImpl->bufferSize = std::max<size_t>(bufferSize, 1);
}

size_t AudioEngine::getBufferSize() const {
    return pImpl->bufferSize;
}

void AudioEngine::setOutputChannels(size_t numChannels) {
    if (pImpl->running) {
        std::cerr << "AudioEngine: Cannot change channel count while running" << std::endl;
        return;
    }
    pImpl->outputChannels = std::max<size_t>(numChannels, 1);
}

size_t AudioEngine::getOutputChannels() const {
    return pImpl->outputChannels;
}

void AudioEngine::setProcessCallback(ProcessCallback callback) {
    if (pImpl->running) {
        std::cerr << "AudioEngine: Cannot change process callback while running" << std::endl;
        return;
    }
    pImpl->processCallback = callback;
}

void AudioEngine::renderInterleaved(float* output, size_t numFrames) {
    AudioBuffer* buffer = pImpl->outputBuffer.get();
    const size_t channels = pImpl->outputChannels;
    if (!buffer || !pImpl->processCallback) {
        std::memset(output, 0, numFrames * channels * sizeof(float));
        return;
    }

    // The host may ask for more frames than the preallocated buffer holds
    size_t done = 0;
    while (done < numFrames) {
        size_t chunk = std::min(numFrames - done, buffer->getNumFrames());
        buffer->clear();
        pImpl->processCallback(*buffer, chunk);
        buffer->copyToInterleaved(output + done * channels, channels, chunk);
        done += chunk;
    }
}

} // namespace fmcore
