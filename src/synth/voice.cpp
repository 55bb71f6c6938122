#include "fmcore/synth/voice.h"

namespace fmcore {

Voice::Voice(double sampleRate)
    : sampleRate_(sampleRate)
    , machine_(std::in_place_type<FmToneVoice>, sampleRate)
    , note_(0)
    , velocity_(0)
    , trackId_(-1)
    , age_(0)
    , free_(true)
    , noteHeld_(false)
    , stolen_(false)
{
}

void Voice::setSampleRate(double sampleRate) {
    sampleRate_ = sampleRate;
    std::visit([sampleRate](auto& machine) { machine.setSampleRate(sampleRate); }, machine_);
}

void Voice::noteOn(int note, int velocity, const VoiceParameters& parameters) {
    parameters_ = parameters;
    note_ = note;
    velocity_ = velocity;
    free_ = false;
    noteHeld_ = true;
    stolen_ = false;

    if (parameters.machine == MachineType::FmDrum) {
        if (!std::holds_alternative<FmDrumVoice>(machine_)) {
            machine_.emplace<FmDrumVoice>(sampleRate_);
        }
        std::get<FmDrumVoice>(machine_).noteOn(note, velocity, parameters.drum, parameters.volume);
    } else {
        if (!std::holds_alternative<FmToneVoice>(machine_)) {
            machine_.emplace<FmToneVoice>(sampleRate_);
        }
        std::get<FmToneVoice>(machine_).noteOn(note, velocity, parameters.tone, parameters.volume);
    }
}

void Voice::noteOff() {
    noteHeld_ = false;
    std::visit([](auto& machine) { machine.noteOff(); }, machine_);
}

void Voice::forceRelease(float seconds) {
    noteHeld_ = false;
    stolen_ = true;
    std::visit([seconds](auto& machine) { machine.forceRelease(seconds); }, machine_);
}

void Voice::reset() {
    std::visit([](auto& machine) { machine.reset(); }, machine_);
    free_ = true;
    noteHeld_ = false;
    stolen_ = false;
    locks_.reset();
    pending_.valid = false;
}

void Voice::updateParameters(const VoiceParameters& parameters) {
    // A machine change takes effect on the next note
    MachineType running = getMachineType();
    parameters_ = parameters;
    parameters_.machine = running;

    if (auto* tone = std::get_if<FmToneVoice>(&machine_)) {
        tone->applyParameters(parameters.tone, parameters.volume);
    } else if (auto* drum = std::get_if<FmDrumVoice>(&machine_)) {
        drum->applyParameters(parameters.drum, parameters.volume);
    }
}

float Voice::renderSample() {
    if (free_) {
        return 0.0f;
    }
    return std::visit([](auto& machine) { return machine.renderSample(); }, machine_);
}

bool Voice::isFinished() const {
    return std::visit([](const auto& machine) { return machine.isFinished(); }, machine_);
}

bool Voice::hasFaulted() const {
    return std::visit([](const auto& machine) { return machine.hasFaulted(); }, machine_);
}

VoiceState Voice::getState() const {
    if (free_) {
        return VoiceState::Free;
    }
    bool releasing = std::visit([](const auto& machine) { return machine.isReleasing(); }, machine_);
    if (!noteHeld_ || stolen_ || releasing) {
        return VoiceState::Releasing;
    }
    return VoiceState::Active;
}

MachineType Voice::getMachineType() const {
    return std::holds_alternative<FmDrumVoice>(machine_) ? MachineType::FmDrum : MachineType::FmTone;
}

} // namespace fmcore
