#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/prctl.h>
#include "fmcore/audio/audio_buffer.h"
#include "fmcore/audio/audio_engine.h"
#include "fmcore/config/engine_config.h"
#include "fmcore/engine/synth_engine.h"
#include "fmcore/engine/trigger_bridge.h"
#include "fmcore/midi/midi_input.h"
#include "fmcore/sequencer/step_sequencer.h"

static std::atomic<bool> g_shouldQuit{false};

void signalHandler(int) {
    g_shouldQuit = true;
}

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [config-file] [--list-midi] [--no-pattern]" << std::endl;
}

// Four-track demo: FM TONE bass line, kick, snare and hats
fmcore::Pattern makeDemoPattern() {
    fmcore::Pattern pattern;

    fmcore::TrackPattern bass;
    bass.trackId = 0;
    bass.length = 16;
    bass.steps.resize(16);
    const int bassNotes[16] = {36, 0, 36, 48, 0, 36, 0, 43, 36, 0, 36, 48, 0, 39, 0, 41};
    for (int i = 0; i < 16; ++i) {
        if (bassNotes[i] > 0) {
            bass.steps[i].active = true;
            bass.steps[i].note = bassNotes[i];
            bass.steps[i].gateLength = 0.5f;
        }
    }
    // Brighter accent on the octave hits
    bass.steps[3].velocity = 120;
    bass.steps[3].locks.push_back({fmcore::ParameterId::Harmony, 0.6f});
    bass.steps[11].locks.push_back({fmcore::ParameterId::Algorithm, 4.0f / 7.0f});
    pattern.tracks.push_back(bass);

    fmcore::TrackPattern kick;
    kick.trackId = 1;
    kick.length = 16;
    kick.steps.resize(16);
    for (int i = 0; i < 16; i += 4) {
        kick.steps[i].active = true;
        kick.steps[i].note = 36;
    }
    pattern.tracks.push_back(kick);

    fmcore::TrackPattern snare;
    snare.trackId = 2;
    snare.length = 16;
    snare.steps.resize(16);
    snare.steps[4].active = true;
    snare.steps[12].active = true;
    snare.steps[15].active = true;
    snare.steps[15].velocity = 70;
    snare.steps[15].retrigCount = 2;
    snare.steps[15].retrigRate = 0.25f;
    pattern.tracks.push_back(snare);

    fmcore::TrackPattern hats;
    hats.trackId = 3;
    hats.length = 8;
    hats.steps.resize(8);
    for (int i = 0; i < 8; ++i) {
        hats.steps[i].active = true;
        hats.steps[i].velocity = (i % 2 == 0) ? 90 : 60;
        hats.steps[i].microTiming = (i % 2 == 0) ? 0.0f : 0.05f;
    }
    pattern.tracks.push_back(hats);

    return pattern;
}

void configureDemoTracks(fmcore::TriggerBridge& bridge, size_t trackCount) {
    using fmcore::ParameterId;

    // Drum type is discrete over Kick..Cymbal
    const float drumTypes[3] = {0.0f, 0.25f, 0.5f};
    for (size_t track = 1; track < std::min<size_t>(trackCount, 4); ++track) {
        bridge.onParameterChange(ParameterId::Machine, 1.0f, static_cast<int>(track));
        bridge.onParameterChange(ParameterId::DrumType, drumTypes[track - 1], static_cast<int>(track));
    }
    bridge.onParameterChange(ParameterId::Algorithm, 2.0f / 7.0f, 0);
    bridge.onParameterChange(ParameterId::Feedback, 0.3f, 0);
    bridge.onParameterChange(ParameterId::AmpRelease, 0.2f, 0);
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGHUP, signalHandler);   // Terminal hangup
    std::signal(SIGTERM, signalHandler);

    #ifdef __linux__
    prctl(PR_SET_PDEATHSIG, SIGTERM);  // Exit with the parent terminal
    #endif

    std::string configPath;
    bool listMidi = false;
    bool playPattern = true;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--list-midi") == 0) {
            listMidi = true;
        } else if (std::strcmp(argv[i], "--no-pattern") == 0) {
            playPattern = false;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (configPath.empty()) {
            configPath = argv[i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (listMidi) {
        auto devices = fmcore::MidiInput::enumerateDevices();
        std::cout << "Available MIDI input ports:" << std::endl;
        if (devices.empty()) {
            std::cout << "  (none)" << std::endl;
        }
        for (const auto& device : devices) {
            std::cout << "  " << device << std::endl;
        }
        return 0;
    }

    fmcore::EngineConfig config;
    if (!configPath.empty() && !config.loadFromFile(configPath)) {
        return 1;
    }
    config.validate();

    std::cout << "fmcore host - Starting..." << std::endl;

    fmcore::SynthEngine engine(config);
    fmcore::TriggerBridge bridge(engine);
    fmcore::AudioEngine audio;
    std::thread offlineClock;
    std::atomic<bool> clockRunning{false};

    bool audioStarted = false;
    if (config.audioEnabled && audio.initialize()) {
        audio.setSampleRate(config.sampleRate);
        audio.setBufferSize(config.bufferSize);
        audio.setOutputChannels(config.outputChannels);
        audio.setProcessCallback([&engine](fmcore::AudioBuffer& output, size_t numFrames) {
            engine.process(output, numFrames);
        });
        engine.prepare(config.sampleRate);
        audioStarted = audio.start();

        // Device refused the configured rate; restart once the engine matches it
        if (audioStarted && audio.getSampleRate() != engine.getSampleRate()) {
            audio.stop();
            engine.prepare(audio.getSampleRate());
            audioStarted = audio.start();
        }
    }

    if (!audioStarted) {
        // No device: keep the engine clock running in real time so sequencing
        // and MIDI still exercise the full path
        std::cout << "fmcore host: Running without audio output" << std::endl;
        engine.prepare(config.sampleRate);
        clockRunning = true;
        offlineClock = std::thread([&engine, &config, &clockRunning]() {
            fmcore::AudioBuffer buffer(config.outputChannels, config.bufferSize);
            auto period = std::chrono::duration<double>(config.bufferSize / config.sampleRate);
            auto next = std::chrono::steady_clock::now();
            while (clockRunning) {
                engine.process(buffer, config.bufferSize);
                next += std::chrono::duration_cast<std::chrono::steady_clock::duration>(period);
                std::this_thread::sleep_until(next);
            }
        });
    }

    // MIDI thread hands messages to the control loop
    std::mutex midiMutex;
    std::vector<fmcore::MidiMessage> pendingMidi;
    fmcore::MidiInput midiInput;
    if (config.midiEnabled && midiInput.openDevice(config.midiDevice)) {
        midiInput.setCallback([&midiMutex, &pendingMidi](const fmcore::MidiMessage& message) {
            std::lock_guard<std::mutex> lock(midiMutex);
            pendingMidi.push_back(message);
        });
        if (!midiInput.start()) {
            midiInput.closeDevice();
        }
    }

    fmcore::StepSequencer sequencer(engine.getSampleRate(), config.tempo);
    const int64_t lookahead = static_cast<int64_t>(
        std::max<double>(2.0 * config.bufferSize, 0.02 * engine.getSampleRate()));
    int64_t scheduledUntil = 0;
    if (playPattern) {
        configureDemoTracks(bridge, engine.getTrackCount());
        sequencer.setPattern(makeDemoPattern());
        sequencer.setSwing(56.0f);
        scheduledUntil = engine.getFramePosition() + lookahead;
        sequencer.start(scheduledUntil);
        std::cout << "fmcore host: Playing demo pattern at " << config.tempo << " BPM" << std::endl;
    }

    std::cout << "fmcore host: Ready. Press Ctrl+C to exit." << std::endl;

    std::vector<fmcore::MidiMessage> midiBatch;
    auto lastReport = std::chrono::steady_clock::now();
    while (!g_shouldQuit) {
        {
            std::lock_guard<std::mutex> lock(midiMutex);
            midiBatch.swap(pendingMidi);
        }
        for (const auto& message : midiBatch) {
            bridge.onMidiMessage(message);
        }
        midiBatch.clear();

        if (sequencer.isPlaying()) {
            int64_t horizon = engine.getFramePosition() + lookahead;
            if (horizon > scheduledUntil) {
                sequencer.schedule(scheduledUntil, horizon, bridge);
                scheduledUntil = horizon;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastReport >= std::chrono::seconds(5)) {
            fmcore::EngineStatus status = engine.getStatus();
            std::cout << "fmcore host: voices " << status.activeVoices << "/"
                      << (status.activeVoices + status.freeVoices)
                      << ", steals " << status.stealCount
                      << ", fuses " << status.fuseCount
                      << ", dropped " << status.droppedCommands + bridge.getDroppedEventCount()
                      << ", cpu " << static_cast<int>(status.cpuLoad * 100.0) << "%" << std::endl;
            lastReport = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    std::cout << "\nShutting down..." << std::endl;
    sequencer.stop();
    bridge.allNotesOff(true);
    midiInput.stop();
    midiInput.closeDevice();

    if (offlineClock.joinable()) {
        clockRunning = false;
        offlineClock.join();
    }
    audio.stop();
    audio.shutdown();

    std::cout << "Done!" << std::endl;
    return 0;
}
