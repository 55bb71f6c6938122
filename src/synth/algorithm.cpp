#include "fmcore/synth/algorithm.h"
#include <algorithm>
#include <iostream>

namespace fmcore {

namespace {
constexpr float kFeedbackDepth = 3.14159265f;   // Phase deviation at full feedback

bool isValidSlot(int slot) {
    return slot >= 0 && slot < static_cast<int>(kNumOperators);
}
}

const std::array<AlgorithmDefinition, kNumAlgorithms>& algorithmDefinitions() {
    static const std::array<AlgorithmDefinition, kNumAlgorithms> definitions = {{
        // 1: B2 -> A -> C on X, B1 alone on Y
        {1, {{OpB2, OpA}, {OpA, OpC}, {OpC, kOutputX}, {OpB1, kOutputY}},
            {{OpB2, OpB2}}},
        // 2: A and B1 both modulate C, B2 alone on Y
        {2, {{OpA, OpC}, {OpB1, OpC}, {OpC, kOutputX}, {OpB2, kOutputY}},
            {{OpB2, OpB2}}},
        // 3: four operator stack, A tapped on Y
        {3, {{OpB2, OpB1}, {OpB1, OpA}, {OpA, OpC}, {OpC, kOutputX}, {OpA, kOutputY}},
            {{OpB2, OpB2}}},
        // 4: two parallel pairs B1 -> C and B2 -> A
        {4, {{OpB1, OpC}, {OpB2, OpA}, {OpC, kOutputX}, {OpA, kOutputY}},
            {{OpB2, OpB2}}},
        // 5: B2 -> A -> C with B1 -> C
        {5, {{OpB2, OpA}, {OpB1, OpC}, {OpA, OpC, 0.7f}, {OpC, kOutputX}, {OpA, kOutputY}},
            {{OpB1, OpB1}}},
        // 6: three modulators into C, B1 tapped on Y
        {6, {{OpA, OpC}, {OpB1, OpC}, {OpB2, OpC}, {OpC, kOutputX}, {OpB1, kOutputY}},
            {{OpB2, OpB2}}},
        // 7: B2 splits into A and B1, both into C
        {7, {{OpB2, OpA}, {OpB2, OpB1}, {OpA, OpC}, {OpB1, OpC}, {OpC, kOutputX}, {OpA, kOutputY}},
            {{OpB2, OpB2}}},
        // 8: cross-coupled modulators with C feeding back into B2
        {8, {{OpB2, OpB1}, {OpB2, OpA, 0.8f}, {OpB1, OpC}, {OpA, OpC}, {OpA, OpB1, 0.5f},
             {OpC, kOutputX}, {OpB1, kOutputY}},
            {{OpC, OpB2}}},
    }};
    return definitions;
}

bool computeRenderOrder(const AlgorithmDefinition& definition,
                        std::array<int, kNumOperators>& order) {
    std::array<int, kNumOperators> inDegree{};
    bool adjacency[kNumOperators][kNumOperators] = {};

    for (const auto& edge : definition.routing) {
        if (!isValidSlot(edge.source)) {
            return false;
        }
        if (edge.isOutput()) {
            if (edge.destination != kOutputX && edge.destination != kOutputY) {
                return false;
            }
            continue;
        }
        if (!isValidSlot(edge.destination) || edge.source == edge.destination) {
            return false;
        }
        if (!adjacency[edge.source][edge.destination]) {
            adjacency[edge.source][edge.destination] = true;
            inDegree[edge.destination]++;
        }
    }

    // Highest slot first among ready nodes keeps modulators ahead of C
    size_t count = 0;
    std::array<bool, kNumOperators> emitted{};
    while (count < kNumOperators) {
        int next = -1;
        for (int slot = static_cast<int>(kNumOperators) - 1; slot >= 0; --slot) {
            if (!emitted[slot] && inDegree[slot] == 0) {
                next = slot;
                break;
            }
        }
        if (next < 0) {
            return false;
        }
        emitted[next] = true;
        order[count++] = next;
        for (size_t dest = 0; dest < kNumOperators; ++dest) {
            if (adjacency[next][dest]) {
                inDegree[dest]--;
            }
        }
    }
    return true;
}

AlgorithmRouter::AlgorithmRouter()
    : algorithmId_(1)
    , modulationDepth_(3.14159265f)
{
    compiledAlgorithms();
}

bool AlgorithmRouter::setAlgorithm(int id) {
    if (id < 1 || id > kNumAlgorithms) {
        return false;
    }
    algorithmId_ = id;
    return true;
}

const AlgorithmDefinition& AlgorithmRouter::getDefinition() const {
    return algorithmDefinitions()[algorithmId_ - 1];
}

const std::array<int, kNumOperators>& AlgorithmRouter::getRenderOrder() const {
    return compiledAlgorithms()[algorithmId_ - 1].order;
}

bool AlgorithmRouter::isCarrier(int slot) const {
    if (!isValidSlot(slot)) {
        return false;
    }
    return compiledAlgorithms()[algorithmId_ - 1].carrier[slot];
}

AlgorithmRouter::Output AlgorithmRouter::render(std::array<Operator, kNumOperators>& operators) {
    const CompiledAlgorithm& algorithm = compiledAlgorithms()[algorithmId_ - 1];

    // Feedback reads what every operator produced on the previous sample
    std::array<float, kNumOperators> previous{};
    for (size_t i = 0; i < kNumOperators; ++i) {
        previous[i] = operators[i].feedbackSignal();
    }

    std::array<float, kNumOperators> current{};
    for (int slot : algorithm.order) {
        float modulation = 0.0f;
        float feedback = 0.0f;
        for (size_t source = 0; source < kNumOperators; ++source) {
            modulation += algorithm.modulation[slot][source] * current[source];
            if (algorithm.feedback[slot][source]) {
                feedback += previous[source];
            }
        }
        float phaseInput = modulation * modulationDepth_
                         + feedback * operators[slot].getFeedbackAmount() * kFeedbackDepth;
        current[slot] = operators[slot].renderSample(phaseInput);
    }

    Output output;
    for (size_t i = 0; i < kNumOperators; ++i) {
        output.x += algorithm.xGain[i] * current[i];
        output.y += algorithm.yGain[i] * current[i];
    }
    return output;
}

const std::array<AlgorithmRouter::CompiledAlgorithm, kNumAlgorithms>&
AlgorithmRouter::compiledAlgorithms() {
    static const std::array<CompiledAlgorithm, kNumAlgorithms> compiled = [] {
        std::array<CompiledAlgorithm, kNumAlgorithms> result{};
        const auto& definitions = algorithmDefinitions();
        for (size_t i = 0; i < definitions.size(); ++i) {
            result[i] = compile(definitions[i]);
        }
        return result;
    }();
    return compiled;
}

AlgorithmRouter::CompiledAlgorithm AlgorithmRouter::compile(const AlgorithmDefinition& definition) {
    CompiledAlgorithm compiled;
    if (!computeRenderOrder(definition, compiled.order)) {
        std::cerr << "AlgorithmRouter: algorithm " << definition.id
                  << " has no valid render order" << std::endl;
        compiled.order = {OpB2, OpB1, OpA, OpC};
        return compiled;
    }

    size_t xCount = 0;
    size_t yCount = 0;
    for (const auto& edge : definition.routing) {
        if (edge.destination == kOutputX) {
            compiled.xGain[edge.source] += edge.amount;
            compiled.carrier[edge.source] = true;
            xCount++;
        } else if (edge.destination == kOutputY) {
            compiled.yGain[edge.source] += edge.amount;
            compiled.carrier[edge.source] = true;
            yCount++;
        } else {
            compiled.modulation[edge.destination][edge.source] += edge.amount;
        }
    }

    // Carriers sharing a bus are averaged
    for (size_t i = 0; i < kNumOperators; ++i) {
        if (xCount > 1) compiled.xGain[i] /= static_cast<float>(xCount);
        if (yCount > 1) compiled.yGain[i] /= static_cast<float>(yCount);
    }

    for (const auto& edge : definition.feedback) {
        if (isValidSlot(edge.source) && isValidSlot(edge.destination)) {
            compiled.feedback[edge.destination][edge.source] = true;
        }
    }
    return compiled;
}

} // namespace fmcore
