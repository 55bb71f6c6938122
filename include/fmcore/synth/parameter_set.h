#pragma once

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>

namespace fmcore {

/**
 * Every automatable parameter of a track
 */
enum class ParameterId : uint8_t {
    // FM TONE
    Algorithm,
    RatioC,
    RatioA,
    RatioB,
    Harmony,
    Detune,
    Feedback,
    Mix,
    AttackA,
    DecayA,
    EndA,
    LevelA,
    AttackB,
    DecayB,
    EndB,
    LevelB,
    Delay,
    TrigMode,
    PhaseReset,
    KeyTracking,
    OffsetA,
    OffsetB,
    VelocitySensitivity,
    Scale,
    Root,
    Tune,
    Fine,
    AmpAttack,
    AmpDecay,
    AmpSustain,
    AmpRelease,
    Volume,
    // Machine selection and FM DRUM
    Machine,
    DrumType,
    BodyTone,
    NoiseLevel,
    SweepAmount,
    SweepTime,
    Wavefold,
    Count
};

constexpr size_t kParameterCount = static_cast<size_t>(ParameterId::Count);

inline size_t parameterIndex(ParameterId id) {
    return static_cast<size_t>(id);
}

/**
 * Per-step override of one parameter (normalized value)
 */
struct ParameterLock {
    ParameterId id = ParameterId::Algorithm;
    float value = 0.0f;
};

/**
 * Set of parameters locked on a single voice
 */
using LockMask = std::bitset<kParameterCount>;

/**
 * Flat record of normalized (0.0 to 1.0) values, one per ParameterId.
 * A default-constructed set holds every parameter's default value.
 */
class ParameterSet {
public:
    ParameterSet();

    float get(ParameterId id) const { return values_[parameterIndex(id)]; }
    void set(ParameterId id, float normalizedValue);

    void resetToDefaults();

    bool operator==(const ParameterSet& other) const { return values_ == other.values_; }
    bool operator!=(const ParameterSet& other) const { return !(*this == other); }

private:
    std::array<float, kParameterCount> values_;
};

} // namespace fmcore
