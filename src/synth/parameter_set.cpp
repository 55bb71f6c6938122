#include "fmcore/synth/parameter_set.h"
#include "fmcore/synth/parameter_mapper.h"

namespace fmcore {

namespace {

const std::array<float, kParameterCount>& defaultValues() {
    static const std::array<float, kParameterCount> defaults = [] {
        std::array<float, kParameterCount> values{};
        for (size_t i = 0; i < kParameterCount; ++i) {
            values[i] = ParameterMapper::defaultNormalized(static_cast<ParameterId>(i));
        }
        return values;
    }();
    return defaults;
}

} // namespace

ParameterSet::ParameterSet() {
    resetToDefaults();
}

void ParameterSet::set(ParameterId id, float normalizedValue) {
    if (id == ParameterId::Count) {
        return;
    }
    values_[parameterIndex(id)] = ParameterMapper::sanitize(id, normalizedValue);
}

void ParameterSet::resetToDefaults() {
    values_ = defaultValues();
}

} // namespace fmcore
