#pragma once

#include <array>
#include <cstddef>
#include <vector>
#include "fmcore/synth/operator.h"

namespace fmcore {

constexpr size_t kNumOperators = 4;
constexpr int kNumAlgorithms = 8;

/**
 * Operator slots of an FM TONE voice
 */
enum OperatorSlot : int {
    OpC = 0,
    OpA = 1,
    OpB1 = 2,
    OpB2 = 3
};

// Destinations of routing edges that end at the voice output
constexpr int kOutputX = -1;
constexpr int kOutputY = -2;

/**
 * Directed routing edge. A negative destination marks a carrier.
 */
struct RoutingEdge {
    int source;
    int destination;
    float amount = 1.0f;

    bool isOutput() const { return destination < 0; }
};

/**
 * Edge carrying the source's previous-sample output
 */
struct FeedbackEdge {
    int source;
    int destination;
};

struct AlgorithmDefinition {
    int id;
    std::vector<RoutingEdge> routing;
    std::vector<FeedbackEdge> feedback;
};

/**
 * The eight fixed FM TONE algorithms, index 0 holding algorithm 1
 */
const std::array<AlgorithmDefinition, kNumAlgorithms>& algorithmDefinitions();

/**
 * Kahn topological sort of the non-feedback modulation edges.
 * Returns false if the graph has a cycle or an edge names an invalid slot.
 */
bool computeRenderOrder(const AlgorithmDefinition& definition,
                        std::array<int, kNumOperators>& order);

/**
 * Renders the four operators of one voice for one sample according to the
 * selected algorithm. All eight graphs are compiled once into flat tables,
 * so switching algorithms on the audio thread never allocates.
 */
class AlgorithmRouter {
public:
    struct Output {
        float x = 0.0f;
        float y = 0.0f;
    };

    AlgorithmRouter();

    bool setAlgorithm(int id);
    int getAlgorithmId() const { return algorithmId_; }
    const AlgorithmDefinition& getDefinition() const;
    const std::array<int, kNumOperators>& getRenderOrder() const;
    bool isCarrier(int slot) const;

    /**
     * Scales modulation edges; the source output (level * envelope, at most 1)
     * times this depth is the phase deviation in radians.
     */
    void setModulationDepth(float radians) { modulationDepth_ = radians; }
    float getModulationDepth() const { return modulationDepth_; }

    Output render(std::array<Operator, kNumOperators>& operators);

private:
    struct CompiledAlgorithm {
        std::array<int, kNumOperators> order{};
        float modulation[kNumOperators][kNumOperators] = {};   // [destination][source]
        bool feedback[kNumOperators][kNumOperators] = {};
        std::array<float, kNumOperators> xGain{};
        std::array<float, kNumOperators> yGain{};
        std::array<bool, kNumOperators> carrier{};
    };

    static const std::array<CompiledAlgorithm, kNumAlgorithms>& compiledAlgorithms();
    static CompiledAlgorithm compile(const AlgorithmDefinition& definition);

    int algorithmId_;
    float modulationDepth_;
};

} // namespace fmcore
