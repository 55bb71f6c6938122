#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include "fmcore/config/engine_config.h"

void testDefaults() {
    fmcore::EngineConfig config;
    assert(config.sampleRate == 48000.0);
    assert(config.bufferSize == 512);
    assert(config.polyphony == 8);
    assert(config.trackCount == 4);
    assert(config.masterGain == 0.5f);
    assert(config.midiDevice.empty());
}

void testParseLine() {
    fmcore::EngineConfig config;
    assert(config.parseLine("polyphony = 16"));
    assert(config.polyphony == 16);
    assert(config.parseLine("  tempo=98.5   # slow groove"));
    assert(config.tempo == 98.5);
    assert(config.parseLine("midi_device = Digitakt:0"));
    assert(config.midiDevice == "Digitakt:0");

    // Blank lines and comments are fine
    assert(config.parseLine(""));
    assert(config.parseLine("   "));
    assert(config.parseLine("# buffer_size = 64"));
    assert(config.bufferSize == 512);

    assert(!config.parseLine("polyphony 16"));
    assert(!config.parseLine("= 16"));
}

void testSetRejectsBadInput() {
    fmcore::EngineConfig config;
    assert(!config.set("reverb_size", "3"));
    assert(!config.set("polyphony", "many"));
    assert(config.polyphony == 8);
    assert(!config.set("sample_rate", ""));
    assert(config.sampleRate == 48000.0);

    assert(config.set("audio_enabled", "off"));
    assert(!config.audioEnabled);
    assert(config.set("midi_enabled", "No"));
    assert(!config.midiEnabled);
    assert(!config.set("midi_enabled", "maybe"));
    assert(!config.midiEnabled);
}

void testValidateClamps() {
    fmcore::EngineConfig config;
    config.sampleRate = 1000.0;
    config.bufferSize = 1;
    config.polyphony = 0;
    config.trackCount = 100;
    config.masterGain = std::numeric_limits<float>::quiet_NaN();
    config.tempo = 1000.0;
    config.validate();

    assert(config.sampleRate == 8000.0);
    assert(config.bufferSize == 16);
    assert(config.polyphony == 1);
    assert(config.trackCount == 16);
    assert(config.masterGain == 0.5f);
    assert(config.tempo == 300.0);

    fmcore::EngineConfig negative;
    assert(negative.set("polyphony", "-4"));
    negative.validate();
    assert(negative.polyphony == 1);
}

void testLoadFromFile() {
    const char* path = "/tmp/fmcore_test_engine_config.cfg";
    {
        std::ofstream file(path);
        file << "# fmcore host settings\n"
             << "sample_rate = 44100\n"
             << "buffer_size = 256\n"
             << "\n"
             << "polyphony = 12\n"
             << "steal_fade_ms = 250\n"
             << "no equals sign here\n"
             << "audio_enabled = false\n";
    }

    fmcore::EngineConfig config;
    assert(config.loadFromFile(path));
    assert(config.sampleRate == 44100.0);
    assert(config.bufferSize == 256);
    assert(config.polyphony == 12);
    assert(config.stealFadeMs == 100.0f);
    assert(!config.audioEnabled);
    std::remove(path);
}

void testMissingFile() {
    fmcore::EngineConfig config;
    assert(!config.loadFromFile("/nonexistent/fmcore.cfg"));
    assert(config.polyphony == 8);
}

int main() {
    testDefaults();
    testParseLine();
    testSetRejectsBadInput();
    testValidateClamps();
    testLoadFromFile();
    testMissingFile();
    return 0;
}
