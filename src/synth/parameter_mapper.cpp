#include "fmcore/synth/parameter_mapper.h"
#include <algorithm>
#include <array>
#include <cmath>

namespace fmcore {

namespace {

using Curve = ParameterCurve;

// Indexed by ParameterId, keep in enum order
const std::array<ParameterDescriptor, kParameterCount> kDescriptors = {{
    {ParameterId::Algorithm,           "algorithm",           1.0f,    8.0f,    Curve::Discrete,    1.0f},
    {ParameterId::RatioC,              "ratioC",              0.5f,    32.0f,   Curve::Exponential, 1.0f},
    {ParameterId::RatioA,              "ratioA",              0.5f,    32.0f,   Curve::Exponential, 1.0f},
    {ParameterId::RatioB,              "ratioB",              0.5f,    32.0f,   Curve::Exponential, 2.0f},
    {ParameterId::Harmony,             "harmony",             0.0f,    1.0f,    Curve::Linear,      0.0f},
    {ParameterId::Detune,              "detune",              0.0f,    50.0f,   Curve::Linear,      0.0f},
    {ParameterId::Feedback,            "feedback",            0.0f,    1.0f,    Curve::Linear,      0.0f},
    {ParameterId::Mix,                 "mix",                 0.0f,    1.0f,    Curve::Linear,      0.0f},
    {ParameterId::AttackA,             "attackA",             0.001f,  10.0f,   Curve::Exponential, 0.001f},
    {ParameterId::DecayA,              "decayA",              0.001f,  10.0f,   Curve::Exponential, 0.5f},
    {ParameterId::EndA,                "endA",                0.0f,    1.0f,    Curve::Linear,      0.0f},
    {ParameterId::LevelA,              "levelA",              0.0f,    1.0f,    Curve::Linear,      0.5f},
    {ParameterId::AttackB,             "attackB",             0.001f,  10.0f,   Curve::Exponential, 0.001f},
    {ParameterId::DecayB,              "decayB",              0.001f,  10.0f,   Curve::Exponential, 0.5f},
    {ParameterId::EndB,                "endB",                0.0f,    1.0f,    Curve::Linear,      0.0f},
    {ParameterId::LevelB,              "levelB",              0.0f,    1.0f,    Curve::Linear,      0.3f},
    {ParameterId::Delay,               "delay",               0.0f,    5.0f,    Curve::Linear,      0.0f},
    {ParameterId::TrigMode,            "trigMode",            0.0f,    2.0f,    Curve::Discrete,    0.0f},
    {ParameterId::PhaseReset,          "phaseReset",          0.0f,    1.0f,    Curve::Discrete,    1.0f},
    {ParameterId::KeyTracking,         "keyTracking",         0.0f,    2.0f,    Curve::Linear,      1.0f},
    {ParameterId::OffsetA,             "offsetA",             -100.0f, 100.0f,  Curve::Linear,      0.0f},
    {ParameterId::OffsetB,             "offsetB",             -100.0f, 100.0f,  Curve::Linear,      0.0f},
    {ParameterId::VelocitySensitivity, "velocitySensitivity", 0.0f,    1.0f,    Curve::Linear,      0.5f},
    {ParameterId::Scale,               "scale",               0.0f,    11.0f,   Curve::Discrete,    0.0f},
    {ParameterId::Root,                "root",                0.0f,    11.0f,   Curve::Discrete,    0.0f},
    {ParameterId::Tune,                "tune",                -24.0f,  24.0f,   Curve::Linear,      0.0f},
    {ParameterId::Fine,                "fine",                -100.0f, 100.0f,  Curve::Linear,      0.0f},
    {ParameterId::AmpAttack,           "ampAttack",           0.001f,  10.0f,   Curve::Exponential, 0.005f},
    {ParameterId::AmpDecay,            "ampDecay",            0.001f,  10.0f,   Curve::Exponential, 0.3f},
    {ParameterId::AmpSustain,          "ampSustain",          0.0f,    1.0f,    Curve::Linear,      0.7f},
    {ParameterId::AmpRelease,          "ampRelease",          0.001f,  10.0f,   Curve::Exponential, 0.3f},
    {ParameterId::Volume,              "volume",              0.0f,    1.0f,    Curve::Linear,      0.8f},
    {ParameterId::Machine,             "machine",             0.0f,    1.0f,    Curve::Discrete,    0.0f},
    {ParameterId::DrumType,            "drumType",            0.0f,    4.0f,    Curve::Discrete,    0.0f},
    {ParameterId::BodyTone,            "bodyTone",            0.0f,    1.0f,    Curve::Linear,      0.7f},
    {ParameterId::NoiseLevel,          "noiseLevel",          0.0f,    1.0f,    Curve::Linear,      0.3f},
    {ParameterId::SweepAmount,         "sweepAmount",         0.0f,    1.0f,    Curve::Linear,      0.4f},
    {ParameterId::SweepTime,           "sweepTime",           0.001f,  2.0f,    Curve::Exponential, 0.1f},
    {ParameterId::Wavefold,            "wavefold",            0.0f,    1.0f,    Curve::Linear,      0.2f},
}};

int toIndex(float value) {
    return static_cast<int>(std::lround(value));
}

} // namespace

const ParameterDescriptor& ParameterMapper::descriptor(ParameterId id) {
    return kDescriptors[std::min(parameterIndex(id), kParameterCount - 1)];
}

std::optional<ParameterId> ParameterMapper::findByName(const std::string& name) {
    for (const auto& desc : kDescriptors) {
        if (name == desc.name) {
            return desc.id;
        }
    }
    return std::nullopt;
}

float ParameterMapper::sanitize(ParameterId id, float normalizedValue) {
    if (!std::isfinite(normalizedValue)) {
        return defaultNormalized(id);
    }
    return std::clamp(normalizedValue, 0.0f, 1.0f);
}

float ParameterMapper::toDspValue(ParameterId id, float normalizedValue) {
    const ParameterDescriptor& desc = descriptor(id);
    float x = sanitize(id, normalizedValue);

    switch (desc.curve) {
        case ParameterCurve::Exponential:
            return desc.minValue * std::pow(desc.maxValue / desc.minValue, x);
        case ParameterCurve::Discrete:
            return std::round(desc.minValue + (desc.maxValue - desc.minValue) * x);
        case ParameterCurve::Linear:
        default:
            return desc.minValue + (desc.maxValue - desc.minValue) * x;
    }
}

float ParameterMapper::toNormalized(ParameterId id, float dspValue) {
    const ParameterDescriptor& desc = descriptor(id);
    if (!std::isfinite(dspValue)) {
        dspValue = desc.defaultValue;
    }
    dspValue = std::clamp(dspValue, desc.minValue, desc.maxValue);

    float normalized = 0.0f;
    if (desc.curve == ParameterCurve::Exponential) {
        normalized = std::log(dspValue / desc.minValue) / std::log(desc.maxValue / desc.minValue);
    } else {
        normalized = (dspValue - desc.minValue) / (desc.maxValue - desc.minValue);
    }
    return std::clamp(normalized, 0.0f, 1.0f);
}

float ParameterMapper::defaultNormalized(ParameterId id) {
    return toNormalized(id, descriptor(id).defaultValue);
}

void ParameterMapper::apply(ParameterId id, float normalizedValue, VoiceParameters& target) {
    write(id, toDspValue(id, normalizedValue), target);
}

VoiceParameters ParameterMapper::resolve(const ParameterSet& parameters) {
    VoiceParameters result;
    for (size_t i = 0; i < kParameterCount; ++i) {
        auto id = static_cast<ParameterId>(i);
        apply(id, parameters.get(id), result);
    }
    return result;
}

void ParameterMapper::write(ParameterId id, float value, VoiceParameters& target) {
    ToneParameters& tone = target.tone;
    DrumParameters& drum = target.drum;

    switch (id) {
        case ParameterId::Algorithm:           tone.algorithm = toIndex(value); break;
        case ParameterId::RatioC:              tone.ratioC = value; break;
        case ParameterId::RatioA:              tone.ratioA = value; break;
        case ParameterId::RatioB:              tone.ratioB = value; break;
        case ParameterId::Harmony:             tone.harmony = value; break;
        case ParameterId::Detune:              tone.detune = value; break;
        case ParameterId::Feedback:            tone.feedback = value; break;
        case ParameterId::Mix:                 tone.mix = value; break;
        case ParameterId::AttackA:             tone.attackA = value; break;
        case ParameterId::DecayA:              tone.decayA = value; break;
        case ParameterId::EndA:                tone.endA = value; break;
        case ParameterId::LevelA:              tone.levelA = value; break;
        case ParameterId::AttackB:             tone.attackB = value; break;
        case ParameterId::DecayB:              tone.decayB = value; break;
        case ParameterId::EndB:                tone.endB = value; break;
        case ParameterId::LevelB:              tone.levelB = value; break;
        case ParameterId::Delay:               tone.delay = value; break;
        case ParameterId::TrigMode:            tone.trigMode = static_cast<TriggerMode>(toIndex(value)); break;
        case ParameterId::PhaseReset:          tone.phaseReset = toIndex(value) != 0; break;
        case ParameterId::KeyTracking:         tone.keyTracking = value; break;
        case ParameterId::OffsetA:             tone.offsetA = value; break;
        case ParameterId::OffsetB:             tone.offsetB = value; break;
        case ParameterId::VelocitySensitivity: tone.velocitySensitivity = value; break;
        case ParameterId::Scale:               tone.scale = toIndex(value); break;
        case ParameterId::Root:                tone.root = toIndex(value); break;
        case ParameterId::Tune:                tone.tune = value; break;
        case ParameterId::Fine:                tone.fine = value; break;
        case ParameterId::AmpAttack:           tone.ampAttack = value; break;
        case ParameterId::AmpDecay:            tone.ampDecay = value; break;
        case ParameterId::AmpSustain:          tone.ampSustain = value; break;
        case ParameterId::AmpRelease:          tone.ampRelease = value; break;
        case ParameterId::Volume:              target.volume = value; break;
        case ParameterId::Machine:             target.machine = static_cast<MachineType>(toIndex(value)); break;
        case ParameterId::DrumType:            drum.type = static_cast<DrumType>(toIndex(value)); break;
        case ParameterId::BodyTone:            drum.bodyTone = value; break;
        case ParameterId::NoiseLevel:          drum.noiseLevel = value; break;
        case ParameterId::SweepAmount:         drum.sweepAmount = value; break;
        case ParameterId::SweepTime:           drum.sweepTime = value; break;
        case ParameterId::Wavefold:            drum.wavefold = value; break;
        case ParameterId::Count:               break;
    }
}

float ParameterMapper::read(ParameterId id, const VoiceParameters& source) {
    const ToneParameters& tone = source.tone;
    const DrumParameters& drum = source.drum;

    switch (id) {
        case ParameterId::Algorithm:           return static_cast<float>(tone.algorithm);
        case ParameterId::RatioC:              return tone.ratioC;
        case ParameterId::RatioA:              return tone.ratioA;
        case ParameterId::RatioB:              return tone.ratioB;
        case ParameterId::Harmony:             return tone.harmony;
        case ParameterId::Detune:              return tone.detune;
        case ParameterId::Feedback:            return tone.feedback;
        case ParameterId::Mix:                 return tone.mix;
        case ParameterId::AttackA:             return tone.attackA;
        case ParameterId::DecayA:              return tone.decayA;
        case ParameterId::EndA:                return tone.endA;
        case ParameterId::LevelA:              return tone.levelA;
        case ParameterId::AttackB:             return tone.attackB;
        case ParameterId::DecayB:              return tone.decayB;
        case ParameterId::EndB:                return tone.endB;
        case ParameterId::LevelB:              return tone.levelB;
        case ParameterId::Delay:               return tone.delay;
        case ParameterId::TrigMode:            return static_cast<float>(tone.trigMode);
        case ParameterId::PhaseReset:          return tone.phaseReset ? 1.0f : 0.0f;
        case ParameterId::KeyTracking:         return tone.keyTracking;
        case ParameterId::OffsetA:             return tone.offsetA;
        case ParameterId::OffsetB:             return tone.offsetB;
        case ParameterId::VelocitySensitivity: return tone.velocitySensitivity;
        case ParameterId::Scale:               return static_cast<float>(tone.scale);
        case ParameterId::Root:                return static_cast<float>(tone.root);
        case ParameterId::Tune:                return tone.tune;
        case ParameterId::Fine:                return tone.fine;
        case ParameterId::AmpAttack:           return tone.ampAttack;
        case ParameterId::AmpDecay:            return tone.ampDecay;
        case ParameterId::AmpSustain:          return tone.ampSustain;
        case ParameterId::AmpRelease:          return tone.ampRelease;
        case ParameterId::Volume:              return source.volume;
        case ParameterId::Machine:             return static_cast<float>(source.machine);
        case ParameterId::DrumType:            return static_cast<float>(drum.type);
        case ParameterId::BodyTone:            return drum.bodyTone;
        case ParameterId::NoiseLevel:          return drum.noiseLevel;
        case ParameterId::SweepAmount:         return drum.sweepAmount;
        case ParameterId::SweepTime:           return drum.sweepTime;
        case ParameterId::Wavefold:            return drum.wavefold;
        case ParameterId::Count:               break;
    }
    return 0.0f;
}

} // namespace fmcore
