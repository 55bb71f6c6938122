#include "fmcore/config/engine_config.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <fstream>
#include <iostream>

namespace fmcore {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool parseBool(const std::string& value, bool& result) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        result = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        result = false;
        return true;
    }
    return false;
}

size_t parseSize(const std::string& value) {
    long parsed = std::stol(value);
    return parsed < 0 ? 0 : static_cast<size_t>(parsed);
}

} // namespace

bool EngineConfig::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "EngineConfig: Cannot open " << filepath << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    int errors = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (!parseLine(line)) {
            std::cerr << "EngineConfig: " << filepath << ":" << lineNumber
                      << ": ignored '" << trim(line) << "'" << std::endl;
            ++errors;
        }
    }

    validate();
    std::cout << "EngineConfig: Loaded " << filepath;
    if (errors > 0) {
        std::cout << " (" << errors << " lines ignored)";
    }
    std::cout << std::endl;
    return true;
}

bool EngineConfig::parseLine(const std::string& line) {
    std::string content = line;
    size_t comment = content.find('#');
    if (comment != std::string::npos) {
        content.erase(comment);
    }
    content = trim(content);
    if (content.empty()) {
        return true;
    }

    size_t equals = content.find('=');
    if (equals == std::string::npos) {
        return false;
    }
    std::string key = trim(content.substr(0, equals));
    std::string value = trim(content.substr(equals + 1));
    if (key.empty()) {
        return false;
    }
    return set(key, value);
}

bool EngineConfig::set(const std::string& key, const std::string& value) {
    try {
        if (key == "sample_rate") {
            sampleRate = std::stod(value);
        } else if (key == "buffer_size") {
            bufferSize = parseSize(value);
        } else if (key == "output_channels") {
            outputChannels = parseSize(value);
        } else if (key == "polyphony") {
            polyphony = parseSize(value);
        } else if (key == "track_count") {
            trackCount = parseSize(value);
        } else if (key == "steal_fade_ms") {
            stealFadeMs = std::stof(value);
        } else if (key == "master_gain") {
            masterGain = std::stof(value);
        } else if (key == "tempo") {
            tempo = std::stod(value);
        } else if (key == "midi_device") {
            midiDevice = value;
        } else if (key == "audio_enabled") {
            if (!parseBool(value, audioEnabled)) {
                std::cerr << "EngineConfig: Invalid boolean for " << key << ": " << value << std::endl;
                return false;
            }
        } else if (key == "midi_enabled") {
            if (!parseBool(value, midiEnabled)) {
                std::cerr << "EngineConfig: Invalid boolean for " << key << ": " << value << std::endl;
                return false;
            }
        } else {
            std::cerr << "EngineConfig: Unknown key: " << key << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "EngineConfig: Invalid value for " << key << ": " << value
                  << " (" << e.what() << ")" << std::endl;
        return false;
    }
    return true;
}

void EngineConfig::validate() {
    sampleRate = std::isnan(sampleRate) ? 48000.0 : std::clamp(sampleRate, 8000.0, 192000.0);
    bufferSize = std::clamp<size_t>(bufferSize, 16, 8192);
    outputChannels = std::clamp<size_t>(outputChannels, 1, 8);
    polyphony = std::clamp<size_t>(polyphony, 1, 64);
    trackCount = std::clamp<size_t>(trackCount, 1, 16);
    stealFadeMs = std::isnan(stealFadeMs) ? 5.0f : std::clamp(stealFadeMs, 0.0f, 100.0f);
    masterGain = std::isnan(masterGain) ? 0.5f : std::clamp(masterGain, 0.0f, 2.0f);
    tempo = std::isnan(tempo) ? 120.0 : std::clamp(tempo, 30.0, 300.0);
}

} // namespace fmcore
