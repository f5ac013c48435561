#ifndef MODEL_HPP
#define MODEL_HPP

#include "Network.hpp"
#include "Params.hpp"
#include "Types.hpp"

#include <vector>

// Population of agents on a network. Owns its agents; neighbors are looked up
// by id in the network, never held as references.
class AgentBasedModel {
public:
    AgentBasedModel(Network network, ModelParameters params,
                    const std::vector<size_t>& initialAdopters);

    // One time step: fitness, then adoption for Legacy agents, then drop for Adaptive agents
    StepRecord advanceOneStep(Rng& gen);

    BehaviorCounts counts() const;
    // Exact probability that the agent adopts in the next step, given the current state
    double adoptionProbability(size_t agentIndex) const;

    const std::vector<Agent>& agents() const { return population; }
    const Network& network() const { return graph; }
    const ModelParameters& params() const { return parameters; }
    size_t step() const { return stepCount; }
    size_t size() const { return population.size(); }

private:
    void advanceSynchronous(Rng& gen);
    void advanceSequential(Rng& gen);
    // Realizes this step's interactions for dyadic payoffs; gen == nullptr averages over neighbors
    double computeFitness(size_t agentIndex, const std::vector<Behavior>& behaviors, Rng* gen) const;
    void updateFitness(const std::vector<Behavior>& behaviors, Rng* gen);
    std::vector<Behavior> behaviors() const;
    std::vector<double> fitness() const;
    std::vector<size_t> visitOrder(Rng& gen) const;

    Network graph;
    ModelParameters parameters;
    std::vector<Agent> population;
    size_t stepCount = 0;
};

AgentBasedModel buildModel(const ModelConfig& config);

#endif // MODEL_HPP
