#include "fmcore/audio/audio_buffer.h"
#include "fmcore/engine/synth_engine.h"
#include "fmcore/engine/trigger_bridge.h"
#include "fmcore/sequencer/step_sequencer.h"
#include <algorithm>
#include <cmath>
#include <iostream>

// Renders two bars of a pattern offline and prints the level of every beat
int main() {
    fmcore::EngineConfig config;
    config.sampleRate = 48000.0;
    config.bufferSize = 256;
    config.trackCount = 2;

    fmcore::SynthEngine engine(config);
    fmcore::TriggerBridge bridge(engine);

    // Track 1 plays the kick
    bridge.onParameterChange(fmcore::ParameterId::Machine, 1.0f, 1);
    bridge.onParameterChange(fmcore::ParameterId::Feedback, 0.4f, 0);

    fmcore::Pattern pattern;
    fmcore::TrackPattern lead;
    lead.trackId = 0;
    lead.length = 8;
    lead.steps.resize(8);
    const int notes[8] = {60, 63, 67, 70, 72, 70, 67, 63};
    for (int i = 0; i < 8; ++i) {
        lead.steps[i].active = true;
        lead.steps[i].note = notes[i];
        lead.steps[i].gateLength = 0.75f;
    }
    lead.steps[4].locks.push_back({fmcore::ParameterId::Harmony, 0.8f});
    pattern.tracks.push_back(lead);

    fmcore::TrackPattern kick;
    kick.trackId = 1;
    kick.length = 4;
    kick.steps.resize(4);
    kick.steps[0].active = true;
    pattern.tracks.push_back(kick);

    fmcore::StepSequencer sequencer(config.sampleRate, 120.0);
    sequencer.setPattern(pattern);
    sequencer.start(0);

    fmcore::AudioBuffer buffer(2, config.bufferSize);
    const int64_t framesPerBeat = static_cast<int64_t>(sequencer.getFramesPerStep() * 4.0);
    const int64_t totalFrames = framesPerBeat * 8;

    float beatPeak = 0.0f;
    int beat = 0;
    for (int64_t frame = 0; frame < totalFrames; frame += config.bufferSize) {
        sequencer.schedule(frame, frame + config.bufferSize, bridge);
        engine.process(buffer, config.bufferSize);
        beatPeak = std::max(beatPeak, buffer.getPeakLevel(0, config.bufferSize));

        if ((frame + config.bufferSize) / framesPerBeat > beat) {
            std::cout << "Beat " << beat + 1 << ": peak " << beatPeak
                      << " (" << 20.0f * std::log10(std::max(beatPeak, 1.0e-6f)) << " dBFS)" << std::endl;
            beatPeak = 0.0f;
            ++beat;
        }
    }

    fmcore::EngineStatus status = engine.getStatus();
    std::cout << "Rendered " << status.framePosition << " frames, "
              << status.stealCount << " steals, "
              << status.fuseCount << " fuses, "
              << status.droppedCommands << " dropped commands" << std::endl;
    return 0;
}
