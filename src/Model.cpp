#include "Model.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

AgentBasedModel::AgentBasedModel(Network network, ModelParameters params,
                                 const std::vector<size_t>& initialAdopters)
    : graph(std::move(network)), parameters(std::move(params))
{
    if (graph.size() == 0) {
        throw EmptyPopulation("Cannot build a model without agents");
    }

    population.resize(graph.size());
    for (size_t i = 0; i < population.size(); ++i) {
        population[i].id = i;
    }

    for (size_t adopter : initialAdopters) {
        if (adopter >= population.size()) {
            throw InvalidConfig("Initial adopter " + std::to_string(adopter) +
                                " is not an agent of this network");
        }
        population[adopter].behavior = Behavior::Adaptive;
    }

    for (const auto& entry : parameters.dyadicRates()) {
        const auto& [focal, teacher] = entry.first;
        if (focal >= population.size() || teacher >= population.size()) {
            throw InvalidConfig("Dyadic adoption rate references unknown agent ids (" +
                                std::to_string(focal) + ", " + std::to_string(teacher) + ")");
        }
    }

    // Initial fitness uses expected payoffs, no interaction has been realized yet
    updateFitness(behaviors(), nullptr);
}

std::vector<Behavior> AgentBasedModel::behaviors() const {
    std::vector<Behavior> result(population.size());
    std::transform(population.begin(), population.end(), result.begin(),
                   [](const Agent& agent) { return agent.behavior; });
    return result;
}

std::vector<double> AgentBasedModel::fitness() const {
    std::vector<double> result(population.size());
    std::transform(population.begin(), population.end(), result.begin(),
                   [](const Agent& agent) { return agent.fitness; });
    return result;
}

BehaviorCounts AgentBasedModel::counts() const {
    BehaviorCounts result{};
    for (const auto& agent : population) {
        result[agent.behavior]++;
    }
    return result;
}

double AgentBasedModel::computeFitness(size_t agentIndex, const std::vector<Behavior>& behaviors,
                                       Rng* gen) const {
    const PayoffModel& payoff = parameters.payoff();
    Behavior own = behaviors[agentIndex];
    if (!payoff.isDyadic()) {
        return payoff.payoff(own);
    }

    size_t degree = graph.degree(agentIndex);
    if (degree == 0) {
        throw RuntimeInvariantError("Agent " + std::to_string(agentIndex) +
                                    " has no neighbor to interact with under payoff '" +
                                    payoff.name() + "'");
    }

    if (gen != nullptr && parameters.interactionMode() == InteractionMode::RandomPartner) {
        std::uniform_int_distribution<size_t> partnerDist(0, degree - 1);
        size_t partner = graph.neighborAt(agentIndex, partnerDist(*gen));
        return payoff.payoff(own, behaviors[partner]);
    }

    double total = 0.0;
    for (size_t k = 0; k < degree; ++k) {
        total += payoff.payoff(own, behaviors[graph.neighborAt(agentIndex, k)]);
    }
    return total / degree;
}

void AgentBasedModel::updateFitness(const std::vector<Behavior>& behaviors, Rng* gen) {
    for (size_t i = 0; i < population.size(); ++i) {
        population[i].fitness = computeFitness(i, behaviors, gen);
    }
}

std::vector<size_t> AgentBasedModel::visitOrder(Rng& gen) const {
    std::vector<size_t> order(population.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), gen);
    return order;
}

StepRecord AgentBasedModel::advanceOneStep(Rng& gen) {
    switch (parameters.updateMode()) {
        case UpdateMode::Synchronous:
            advanceSynchronous(gen);
            break;
        case UpdateMode::Sequential:
            advanceSequential(gen);
            break;
        default:
            throw InvalidParameter("Invalid update mode");
    }
    ++stepCount;
    return {stepCount, counts()};
}

void AgentBasedModel::advanceSynchronous(Rng& gen) {
    const std::vector<Behavior> snapshot = behaviors();
    updateFitness(snapshot, &gen);
    const std::vector<double> snapshotFitness = fitness();

    const size_t snapshotAdopters = counts()[Behavior::Adaptive];

    std::vector<Behavior> next = snapshot;
    std::uniform_real_distribution<> dist(0.0, 1.0);

    for (size_t i : visitOrder(gen)) {
        if (snapshot[i] == Behavior::Legacy) {
            LearningContext ctx{i, graph, snapshot, snapshotFitness, parameters.adoptionRate(),
                                &parameters.dyadicRates(), snapshotAdopters};
            if (parameters.strategy().decide(ctx, gen)) {
                next[i] = Behavior::Adaptive;
            }
        } else if (dist(gen) < parameters.dropRate()) {
            next[i] = Behavior::Legacy;
        }
    }

    for (size_t i = 0; i < population.size(); ++i) {
        population[i].behavior = next[i];
    }

    // Dyadic fitness is realized again at the start of the next step
    if (!parameters.payoff().isDyadic()) {
        updateFitness(next, nullptr);
    }
}

void AgentBasedModel::advanceSequential(Rng& gen) {
    std::vector<Behavior> live = behaviors();
    updateFitness(live, &gen);
    std::vector<double> liveFitness = fitness();

    size_t liveAdopters = counts()[Behavior::Adaptive];

    const bool dyadic = parameters.payoff().isDyadic();
    std::uniform_real_distribution<> dist(0.0, 1.0);

    for (size_t i : visitOrder(gen)) {
        Behavior before = live[i];
        if (before == Behavior::Legacy) {
            LearningContext ctx{i, graph, live, liveFitness, parameters.adoptionRate(),
                                &parameters.dyadicRates(), liveAdopters};
            if (parameters.strategy().decide(ctx, gen)) {
                live[i] = Behavior::Adaptive;
            }
        } else if (dist(gen) < parameters.dropRate()) {
            live[i] = Behavior::Legacy;
        }

        if (live[i] != before) {
            population[i].behavior = live[i];
            if (live[i] == Behavior::Adaptive) {
                liveAdopters++;
            } else {
                liveAdopters--;
            }
            if (!dyadic) {
                population[i].fitness = computeFitness(i, live, nullptr);
                liveFitness[i] = population[i].fitness;
            }
        }
    }
}

double AgentBasedModel::adoptionProbability(size_t agentIndex) const {
    if (agentIndex >= population.size()) {
        throw InvalidConfig("Unknown agent id " + std::to_string(agentIndex));
    }
    // Adaptive agents only leave their behavior through the drop rule
    if (population[agentIndex].behavior == Behavior::Adaptive) {
        return 0.0;
    }
    const std::vector<Behavior> current = behaviors();
    const std::vector<double> currentFitness = fitness();
    LearningContext ctx{agentIndex, graph, current, currentFitness, parameters.adoptionRate(),
                        &parameters.dyadicRates(), counts()[Behavior::Adaptive]};
    return parameters.strategy().adoptionProbability(ctx);
}

AgentBasedModel buildModel(const ModelConfig& config) {
    if (!isProbability(config.adoptionRate)) {
        throw InvalidConfig("Adoption rate must lie in [0, 1], got " +
                            std::to_string(config.adoptionRate));
    }
    if (!isProbability(config.dropRate)) {
        throw InvalidConfig("Drop rate must lie in [0, 1], got " + std::to_string(config.dropRate));
    }

    ModelParameters params(makeStrategy(config.strategy, config.slope),
                           makePayoff(config.payoff.kind, config.payoff.values),
                           config.adoptionRate,
                           config.dropRate,
                           config.dyadicRates,
                           config.updateMode,
                           config.interactionMode);
    return AgentBasedModel(config.network, std::move(params), config.initialAdopters);
}
