#pragma once

#include <cstddef>
#include <string>

namespace fmcore {

/**
 * Engine and host settings, loaded from a `key = value` text file.
 *
 * Lines starting with '#' and blank lines are ignored. Unknown keys and
 * unparsable values are reported on std::cerr and leave the field unchanged.
 */
struct EngineConfig {
    double sampleRate = 48000.0;
    size_t bufferSize = 512;
    size_t outputChannels = 2;
    size_t polyphony = 8;
    size_t trackCount = 4;
    float stealFadeMs = 5.0f;
    float masterGain = 0.5f;
    double tempo = 120.0;
    std::string midiDevice;         // Empty: connect to every readable port
    bool audioEnabled = true;
    bool midiEnabled = true;

    bool loadFromFile(const std::string& filepath);

    // Parses one line; returns false if the line was malformed
    bool parseLine(const std::string& line);

    // Sets one field by name; returns false for unknown keys or bad values
    bool set(const std::string& key, const std::string& value);

    // Clamps every field into its supported range
    void validate();
};

} // namespace fmcore
