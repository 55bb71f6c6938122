#pragma once

#include <optional>
#include <string>
#include "fmcore/synth/parameter_set.h"
#include "fmcore/synth/voice_parameters.h"

namespace fmcore {

enum class ParameterCurve {
    Linear,         // min + (max - min) * x
    Exponential,    // min * (max / min)^x
    Discrete        // round(min + (max - min) * x)
};

/**
 * Static description of one parameter
 */
struct ParameterDescriptor {
    ParameterId id;
    const char* name;
    float minValue;
    float maxValue;
    ParameterCurve curve;
    float defaultValue;     // DSP domain
};

/**
 * Converts normalized control values into DSP values and writes them into
 * VoiceParameters. The descriptor table is the single source of ranges and
 * curves for every ParameterId.
 */
class ParameterMapper {
public:
    static const ParameterDescriptor& descriptor(ParameterId id);
    static std::optional<ParameterId> findByName(const std::string& name);

    // Curve evaluation. Input is clamped to [0, 1]; NaN maps to the default.
    static float toDspValue(ParameterId id, float normalizedValue);
    static float toNormalized(ParameterId id, float dspValue);
    static float defaultNormalized(ParameterId id);
    static float sanitize(ParameterId id, float normalizedValue);

    // Field access
    static void apply(ParameterId id, float normalizedValue, VoiceParameters& target);
    static float read(ParameterId id, const VoiceParameters& source);

    static VoiceParameters resolve(const ParameterSet& parameters);

private:
    static void write(ParameterId id, float dspValue, VoiceParameters& target);
};

} // namespace fmcore
