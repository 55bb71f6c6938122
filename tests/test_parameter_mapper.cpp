#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include "fmcore/synth/parameter_mapper.h"
#include "fmcore/synth/parameter_set.h"

using namespace fmcore;

namespace {
bool approx(float a, float b, float tolerance = 1e-4f) {
    return std::fabs(a - b) <= tolerance * std::max(1.0f, std::fabs(b));
}
}

void testDescriptorTableOrder() {
    for (size_t i = 0; i < kParameterCount; ++i) {
        auto id = static_cast<ParameterId>(i);
        const ParameterDescriptor& desc = ParameterMapper::descriptor(id);
        assert(desc.id == id);
        assert(desc.minValue < desc.maxValue);
        assert(desc.defaultValue >= desc.minValue && desc.defaultValue <= desc.maxValue);
    }
}

void testExponentialRatio() {
    assert(approx(ParameterMapper::toDspValue(ParameterId::RatioC, 0.0f), 0.5f));
    assert(approx(ParameterMapper::toDspValue(ParameterId::RatioC, 1.0f), 32.0f));
    // Geometric midpoint
    assert(approx(ParameterMapper::toDspValue(ParameterId::RatioC, 0.5f), 4.0f));

    float normalized = ParameterMapper::toNormalized(ParameterId::RatioA, 3.0f);
    assert(approx(ParameterMapper::toDspValue(ParameterId::RatioA, normalized), 3.0f));
}

void testDiscreteAlgorithm() {
    assert(ParameterMapper::toDspValue(ParameterId::Algorithm, 0.0f) == 1.0f);
    assert(ParameterMapper::toDspValue(ParameterId::Algorithm, 1.0f) == 8.0f);
    assert(ParameterMapper::toDspValue(ParameterId::Algorithm, 4.0f / 7.0f) == 5.0f);

    VoiceParameters params;
    ParameterMapper::apply(ParameterId::Algorithm, 3.0f / 7.0f, params);
    assert(params.tone.algorithm == 4);

    ParameterMapper::apply(ParameterId::DrumType, 0.5f, params);
    assert(params.drum.type == DrumType::HiHat);
    ParameterMapper::apply(ParameterId::Machine, 1.0f, params);
    assert(params.machine == MachineType::FmDrum);
}

void testOutOfRangeInput() {
    // Clamped, never extrapolated
    assert(approx(ParameterMapper::toDspValue(ParameterId::Feedback, 2.0f), 1.0f));
    assert(approx(ParameterMapper::toDspValue(ParameterId::Feedback, -1.0f), 0.0f));

    // Non-finite input falls back to the default
    float nan = std::numeric_limits<float>::quiet_NaN();
    assert(approx(ParameterMapper::toDspValue(ParameterId::LevelA, nan), 0.5f));
    float inf = std::numeric_limits<float>::infinity();
    assert(approx(ParameterMapper::toDspValue(ParameterId::AmpRelease, inf), 0.3f));
}

void testApplyAndRead() {
    VoiceParameters params;
    ParameterMapper::apply(ParameterId::Tune, 0.75f, params);
    assert(approx(params.tone.tune, 12.0f));
    assert(approx(ParameterMapper::read(ParameterId::Tune, params), 12.0f));

    ParameterMapper::apply(ParameterId::PhaseReset, 0.0f, params);
    assert(!params.tone.phaseReset);
    ParameterMapper::apply(ParameterId::Volume, 0.25f, params);
    assert(approx(params.volume, 0.25f));

    // Count is not a parameter
    VoiceParameters before = params;
    ParameterMapper::apply(ParameterId::Count, 1.0f, params);
    assert(params.volume == before.volume);
}

void testEveryParameterReadsBackWhatWasApplied() {
    const float positions[] = {0.0f, 0.13f, 0.5f, 0.77f, 1.0f};
    for (size_t i = 0; i < kParameterCount; ++i) {
        auto id = static_cast<ParameterId>(i);
        for (float x : positions) {
            VoiceParameters params;
            ParameterMapper::apply(id, x, params);
            assert(approx(ParameterMapper::read(id, params), ParameterMapper::toDspValue(id, x)));
        }
    }
}

void testFindByName() {
    auto found = ParameterMapper::findByName("ratioB");
    assert(found.has_value());
    assert(*found == ParameterId::RatioB);
    assert(ParameterMapper::findByName("wavefold") == ParameterId::Wavefold);
    assert(!ParameterMapper::findByName("cutoff").has_value());
}

void testParameterSetDefaults() {
    ParameterSet set;
    for (size_t i = 0; i < kParameterCount; ++i) {
        auto id = static_cast<ParameterId>(i);
        assert(approx(set.get(id), ParameterMapper::defaultNormalized(id)));
    }

    // Defaults resolve to the stock voice settings
    VoiceParameters resolved = ParameterMapper::resolve(set);
    VoiceParameters stock;
    assert(resolved.machine == stock.machine);
    assert(resolved.tone.algorithm == stock.tone.algorithm);
    assert(approx(resolved.tone.ratioB, stock.tone.ratioB));
    assert(approx(resolved.tone.ampSustain, stock.tone.ampSustain));
    assert(approx(resolved.tone.ampRelease, stock.tone.ampRelease));
    assert(approx(resolved.drum.sweepTime, stock.drum.sweepTime));
    assert(resolved.drum.type == stock.drum.type);
}

void testParameterSetSanitizes() {
    ParameterSet set;
    set.set(ParameterId::Mix, 1.5f);
    assert(set.get(ParameterId::Mix) == 1.0f);
    set.set(ParameterId::Harmony, std::numeric_limits<float>::quiet_NaN());
    assert(set.get(ParameterId::Harmony) == ParameterMapper::defaultNormalized(ParameterId::Harmony));

    ParameterSet other;
    assert(set != other);
    set.resetToDefaults();
    assert(set == other);
}

int main() {
    testDescriptorTableOrder();
    testExponentialRatio();
    testDiscreteAlgorithm();
    testOutOfRangeInput();
    testApplyAndRead();
    testEveryParameterReadsBackWhatWasApplied();
    testFindByName();
    testParameterSetDefaults();
    testParameterSetSanitizes();
    return 0;
}
