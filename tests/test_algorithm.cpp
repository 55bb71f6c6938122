#include <array>
#include <cassert>
#include <cmath>
#include "fmcore/synth/algorithm.h"
#include "fmcore/synth/fm_tone_voice.h"

using namespace fmcore;

namespace {
int positionOf(const std::array<int, kNumOperators>& order, int slot) {
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] == slot) {
            return static_cast<int>(i);
        }
    }
    return -1;
}
}

void testAllAlgorithmsAreAcyclic() {
    const auto& definitions = algorithmDefinitions();
    for (int i = 0; i < kNumAlgorithms; ++i) {
        const AlgorithmDefinition& definition = definitions[i];
        assert(definition.id == i + 1);

        std::array<int, kNumOperators> order{};
        assert(computeRenderOrder(definition, order));

        // Every operator appears once and modulators render before their targets
        for (int slot = 0; slot < static_cast<int>(kNumOperators); ++slot) {
            assert(positionOf(order, slot) >= 0);
        }
        for (const auto& edge : definition.routing) {
            if (!edge.isOutput()) {
                assert(positionOf(order, edge.source) < positionOf(order, edge.destination));
            }
        }
    }
}

void testEveryAlgorithmHasCarriers() {
    AlgorithmRouter router;
    for (int id = 1; id <= kNumAlgorithms; ++id) {
        assert(router.setAlgorithm(id));
        bool anyCarrier = false;
        for (int slot = 0; slot < static_cast<int>(kNumOperators); ++slot) {
            anyCarrier = anyCarrier || router.isCarrier(slot);
        }
        assert(anyCarrier);
    }

    assert(router.setAlgorithm(1));
    assert(router.isCarrier(OpC));
    assert(router.isCarrier(OpB1));
    assert(!router.isCarrier(OpA));
    assert(!router.isCarrier(OpB2));
}

void testCycleIsRejected() {
    AlgorithmDefinition cyclic{99, {{OpA, OpC}, {OpC, OpA}, {OpC, kOutputX}}, {}};
    std::array<int, kNumOperators> order{};
    assert(!computeRenderOrder(cyclic, order));

    AlgorithmDefinition badSlot{98, {{7, OpC}, {OpC, kOutputX}}, {}};
    assert(!computeRenderOrder(badSlot, order));
}

void testInvalidAlgorithmIdIsRejected() {
    AlgorithmRouter router;
    assert(router.setAlgorithm(3));
    assert(!router.setAlgorithm(0));
    assert(!router.setAlgorithm(9));
    assert(router.getAlgorithmId() == 3);
}

void testFeedbackIsBounded() {
    // Maximum feedback and modulation depth on every algorithm
    for (int id = 1; id <= kNumAlgorithms; ++id) {
        ToneParameters params;
        params.algorithm = id;
        params.feedback = 1.0f;
        params.harmony = 1.0f;
        params.levelA = 1.0f;
        params.levelB = 1.0f;
        params.endA = 1.0f;
        params.endB = 1.0f;
        params.mix = 0.5f;

        FmToneVoice voice(48000.0);
        voice.noteOn(60, 127, params, 1.0f);
        for (int i = 0; i < 10000; ++i) {
            float sample = voice.renderSample();
            assert(std::isfinite(sample));
            assert(std::fabs(sample) <= 1.0f);
        }
        assert(!voice.hasFaulted());
    }
}

void testSingleCarrierIsPureSine() {
    // Algorithm 1 with silent modulators leaves C as a plain sine on X
    std::array<Operator, kNumOperators> operators;
    for (auto& op : operators) {
        op.setSampleRate(48000.0);
        op.setBaseFrequency(1000.0f);
    }
    operators[OpA].setOutputLevel(0.0f);
    operators[OpB1].setOutputLevel(0.0f);
    operators[OpB2].setOutputLevel(0.0f);

    AlgorithmRouter router;
    router.setAlgorithm(1);
    for (int i = 1; i <= 100; ++i) {
        AlgorithmRouter::Output out = router.render(operators);
        float expected = static_cast<float>(std::sin(6.283185307179586 * 1000.0 * i / 48000.0));
        assert(std::fabs(out.x - expected) < 1e-4f);
        assert(out.y == 0.0f);
    }
}

int main() {
    testAllAlgorithmsAreAcyclic();
    testEveryAlgorithmHasCarriers();
    testCycleIsRejected();
    testInvalidAlgorithmIdIsRejected();
    testFeedbackIsBounded();
    testSingleCarrierIsPureSine();
    return 0;
}
