#include "Strategies.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {

void checkSlope(double slope, bool allowZero) {
    if (!std::isfinite(slope) || slope < 0.0 || (!allowZero && slope == 0.0)) {
        throw InvalidParameter("Bias exponent out of range: " + std::to_string(slope));
    }
}

} // namespace

LearningContext::LearningContext(size_t focal, const std::vector<size_t>& neighbors,
                                 const std::vector<Behavior>& behaviors,
                                 const std::vector<double>& fitness,
                                 double adoptionRate, const DyadicRates* dyadicRates)
    : focal(focal), behaviors(behaviors), fitness(fitness), adoptionRate(adoptionRate),
      dyadicRates(dyadicRates), neighborList(&neighbors) {}

LearningContext::LearningContext(size_t focal, const Network& network,
                                 const std::vector<Behavior>& behaviors,
                                 const std::vector<double>& fitness,
                                 double adoptionRate, const DyadicRates* dyadicRates,
                                 std::optional<size_t> populationAdopters)
    : focal(focal), behaviors(behaviors), fitness(fitness), adoptionRate(adoptionRate),
      dyadicRates(dyadicRates), network(&network), populationAdopters(populationAdopters) {}

size_t LearningContext::degree() const {
    return neighborList != nullptr ? neighborList->size() : network->degree(focal);
}

size_t LearningContext::neighborAt(size_t k) const {
    return neighborList != nullptr ? (*neighborList)[k] : network->neighborAt(focal, k);
}

double LearningContext::gate(size_t teacher) const {
    if (dyadicRates != nullptr) {
        auto it = dyadicRates->find({focal, teacher});
        if (it != dyadicRates->end()) {
            return it->second;
        }
    }
    return adoptionRate;
}

size_t LearningContext::adopters() const {
    // On a complete graph every other agent is a neighbor
    if (network != nullptr && network->isComplete() && populationAdopters) {
        return *populationAdopters - (behaviors[focal] == Behavior::Adaptive ? 1 : 0);
    }
    size_t count = 0;
    for (size_t k = 0; k < degree(); ++k) {
        if (behaviors[neighborAt(k)] == Behavior::Adaptive) {
            count++;
        }
    }
    return count;
}

double LearningContext::adopterGateSum() const {
    if (dyadicRates == nullptr || dyadicRates->empty()) {
        return adoptionRate * adopters();
    }
    double sum = 0.0;
    for (size_t k = 0; k < degree(); ++k) {
        size_t j = neighborAt(k);
        if (behaviors[j] == Behavior::Adaptive) {
            sum += gate(j);
        }
    }
    return sum;
}

bool LearningStrategy::decide(const LearningContext& ctx, Rng& gen) const {
    std::optional<size_t> teacher = selectTeacher(ctx, gen);
    if (!teacher || *teacher == ctx.focal || ctx.behaviors[*teacher] != Behavior::Adaptive) {
        return false;
    }
    std::uniform_real_distribution<> dist(0.0, 1.0);
    return dist(gen) < ctx.gate(*teacher);
}

SuccessBiasedStrategy::SuccessBiasedStrategy(double slope, bool includeSelf)
    : slope(slope), includeSelf(includeSelf)
{
    checkSlope(slope, true);
}

std::vector<size_t> SuccessBiasedStrategy::candidates(const LearningContext& ctx) const {
    std::vector<size_t> pool(ctx.degree());
    for (size_t k = 0; k < pool.size(); ++k) {
        pool[k] = ctx.neighborAt(k);
    }
    if (includeSelf) {
        pool.push_back(ctx.focal);
    }
    return pool;
}

std::vector<double> SuccessBiasedStrategy::successWeights(const LearningContext& ctx,
                                                          const std::vector<size_t>& pool) const {
    double best = 0.0;
    for (size_t j : pool) {
        best = std::max(best, ctx.fitness[j]);
    }
    // Ratios f_j / f_max keep f^slope from overflowing; all zero stays all zero
    double scale = best > 0.0 ? best : 1.0;

    std::vector<double> weights(pool.size());
    std::transform(pool.begin(), pool.end(), weights.begin(),
                   [&ctx, scale, slope = this->slope](size_t j) {
                       double ratio = ctx.fitness[j] / scale;
                       return slope == 1.0 ? ratio : std::pow(ratio, slope);
                   });
    return weights;
}

double SuccessBiasedStrategy::adoptionProbability(const LearningContext& ctx) const {
    std::vector<size_t> pool = candidates(ctx);
    if (pool.empty()) {
        return 0.0;
    }
    std::vector<double> weights = successWeights(ctx, pool);
    double total = std::accumulate(weights.begin(), weights.end(), 0.0);

    // Zero total fitness falls back to uniform teacher choice
    double numerator = 0.0;
    for (size_t k = 0; k < pool.size(); ++k) {
        size_t j = pool[k];
        if (j != ctx.focal && ctx.behaviors[j] == Behavior::Adaptive) {
            numerator += (total > 0.0 ? weights[k] : 1.0) * ctx.gate(j);
        }
    }
    return total > 0.0 ? numerator / total : numerator / pool.size();
}

std::optional<size_t> SuccessBiasedStrategy::selectTeacher(const LearningContext& ctx,
                                                           Rng& gen) const {
    std::vector<size_t> pool = candidates(ctx);
    if (pool.empty()) {
        return std::nullopt;
    }
    std::vector<double> weights = successWeights(ctx, pool);
    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (total > 0.0) {
        std::discrete_distribution<size_t> teacherDist(weights.begin(), weights.end());
        return pool[teacherDist(gen)];
    }
    std::uniform_int_distribution<size_t> uniformDist(0, pool.size() - 1);
    return pool[uniformDist(gen)];
}

FrequencyBiasedStrategy::FrequencyBiasedStrategy(double slope)
    : slope(slope)
{
    checkSlope(slope, false);
}

double FrequencyBiasedStrategy::adoptionProbability(const LearningContext& ctx) const {
    // An isolated agent never learns through this channel
    if (ctx.degree() == 0) {
        return 0.0;
    }
    size_t adopters = ctx.adopters();
    if (adopters == 0) {
        return 0.0;
    }
    if (slope == 1.0) {
        return ctx.adopterGateSum() / ctx.degree();
    }
    double share = static_cast<double>(adopters) / ctx.degree();
    double conformity = std::pow(share, slope) /
                        (std::pow(share, slope) + std::pow(1.0 - share, slope));
    return conformity * ctx.adopterGateSum() / adopters;
}

std::optional<size_t> FrequencyBiasedStrategy::selectTeacher(const LearningContext& /*ctx*/,
                                                             Rng& /*gen*/) const {
    return std::nullopt;
}

bool FrequencyBiasedStrategy::decide(const LearningContext& ctx, Rng& gen) const {
    double probability = adoptionProbability(ctx);
    if (probability <= 0.0) {
        return false;
    }
    std::uniform_real_distribution<> dist(0.0, 1.0);
    return dist(gen) < probability;
}

double ContagionStrategy::adoptionProbability(const LearningContext& ctx) const {
    if (ctx.degree() == 0) {
        return 0.0;
    }
    return ctx.adopterGateSum() / ctx.degree();
}

std::optional<size_t> ContagionStrategy::selectTeacher(const LearningContext& ctx, Rng& gen) const {
    if (ctx.degree() == 0) {
        return std::nullopt;
    }
    std::uniform_int_distribution<size_t> teacherDist(0, ctx.degree() - 1);
    return ctx.neighborAt(teacherDist(gen));
}

std::shared_ptr<const LearningStrategy> makeStrategy(Strategy strategy, double slope) {
    switch (strategy) {
        case Strategy::SuccessBiased:
            return std::make_shared<SuccessBiasedStrategy>(slope);
        case Strategy::FrequencyBiased:
            return std::make_shared<FrequencyBiasedStrategy>(slope);
        case Strategy::Contagion:
            return std::make_shared<ContagionStrategy>();
        default:
            throw UnknownStrategy("Unknown strategy");
    }
}

std::shared_ptr<const LearningStrategy> makeStrategy(const std::string& name, double slope) {
    if (name == "success") {
        return std::make_shared<SuccessBiasedStrategy>(slope, false);
    }
    if (name == "success_self") {
        return std::make_shared<SuccessBiasedStrategy>(slope, true);
    }
    if (name == "frequency") {
        return std::make_shared<FrequencyBiasedStrategy>(slope);
    }
    if (name == "contagion") {
        return std::make_shared<ContagionStrategy>();
    }
    throw UnknownStrategy("Unknown strategy '" + name + "'");
}
