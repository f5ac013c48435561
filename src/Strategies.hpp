#ifndef STRATEGIES_HPP
#define STRATEGIES_HPP

#include "Network.hpp"
#include "Types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct DyadHash {
    size_t operator()(const std::pair<size_t, size_t>& dyad) const {
        size_t hash = std::hash<size_t>{}(dyad.first);
        hash ^= std::hash<size_t>{}(dyad.second) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
        return hash;
    }
};

// Adoption rate overrides keyed by (focal, teacher)
using DyadicRates = std::unordered_map<std::pair<size_t, size_t>, double, DyadHash>;

// Everything a strategy may look at when the focal agent considers adopting.
// behaviors and fitness are the start-of-step snapshot. Neighbors come either from
// an explicit list or straight from the network, so a complete graph is never expanded.
struct LearningContext {
    LearningContext(size_t focal, const std::vector<size_t>& neighbors,
                    const std::vector<Behavior>& behaviors, const std::vector<double>& fitness,
                    double adoptionRate, const DyadicRates* dyadicRates = nullptr);
    // populationAdopters is the number of Adaptive agents in behaviors, if the caller has it
    LearningContext(size_t focal, const Network& network,
                    const std::vector<Behavior>& behaviors, const std::vector<double>& fitness,
                    double adoptionRate, const DyadicRates* dyadicRates = nullptr,
                    std::optional<size_t> populationAdopters = std::nullopt);

    size_t focal;
    const std::vector<Behavior>& behaviors;
    const std::vector<double>& fitness;
    double adoptionRate;
    const DyadicRates* dyadicRates;

    size_t degree() const;
    // k-th neighbor of the focal agent, 0 <= k < degree()
    size_t neighborAt(size_t k) const;

    // Probability that learning from this teacher actually takes
    double gate(size_t teacher) const;
    size_t adopters() const;
    // Sum of gate(j) over Adaptive neighbors j
    double adopterGateSum() const;

private:
    const std::vector<size_t>* neighborList = nullptr;
    const Network* network = nullptr;
    std::optional<size_t> populationAdopters;
};

class LearningStrategy {
public:
    virtual ~LearningStrategy() = default;

    virtual Strategy kind() const = 0;
    virtual std::string name() const = 0;

    // Exact probability that ctx.focal switches to Adaptive this step
    virtual double adoptionProbability(const LearningContext& ctx) const = 0;
    // Strategies that learn without a teacher return nullopt
    virtual std::optional<size_t> selectTeacher(const LearningContext& ctx, Rng& gen) const = 0;
    // One adoption draw. Default: pick a teacher, copy it if it is Adaptive and the gate passes.
    virtual bool decide(const LearningContext& ctx, Rng& gen) const;
};

// Teacher drawn with probability f_j^slope / sum_k f_k^slope, uniform when all weights are zero.
// Fitness is scaled by the largest candidate fitness before the exponent, so weights stay in [0, 1].
// With includeSelf the focal agent is also a candidate; drawing itself means no change.
class SuccessBiasedStrategy : public LearningStrategy {
public:
    explicit SuccessBiasedStrategy(double slope = 1.0, bool includeSelf = false);

    Strategy kind() const override { return Strategy::SuccessBiased; }
    std::string name() const override { return includeSelf ? "success_self" : "success"; }
    double adoptionProbability(const LearningContext& ctx) const override;
    std::optional<size_t> selectTeacher(const LearningContext& ctx, Rng& gen) const override;

    bool includesSelf() const { return includeSelf; }

private:
    std::vector<size_t> candidates(const LearningContext& ctx) const;
    std::vector<double> successWeights(const LearningContext& ctx,
                                       const std::vector<size_t>& pool) const;

    double slope;
    bool includeSelf;
};

// No teacher: adopt with probability alpha * g(p), p the adopting share of neighbors.
// g(p) = p^slope / (p^slope + (1-p)^slope), which is p itself for slope 1.
class FrequencyBiasedStrategy : public LearningStrategy {
public:
    explicit FrequencyBiasedStrategy(double slope = 1.0);

    Strategy kind() const override { return Strategy::FrequencyBiased; }
    std::string name() const override { return "frequency"; }
    double adoptionProbability(const LearningContext& ctx) const override;
    std::optional<size_t> selectTeacher(const LearningContext& ctx, Rng& gen) const override;
    bool decide(const LearningContext& ctx, Rng& gen) const override;

private:
    double slope;
};

// Teacher drawn uniformly; exposure to an Adaptive teacher converts with the adoption rate
class ContagionStrategy : public LearningStrategy {
public:
    Strategy kind() const override { return Strategy::Contagion; }
    std::string name() const override { return "contagion"; }
    double adoptionProbability(const LearningContext& ctx) const override;
    std::optional<size_t> selectTeacher(const LearningContext& ctx, Rng& gen) const override;
};

std::shared_ptr<const LearningStrategy> makeStrategy(Strategy strategy, double slope = 1.0);
// Accepts "success", "success_self", "frequency" and "contagion"
std::shared_ptr<const LearningStrategy> makeStrategy(const std::string& name, double slope = 1.0);

#endif // STRATEGIES_HPP
