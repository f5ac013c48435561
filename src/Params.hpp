#ifndef PARAMS_HPP
#define PARAMS_HPP

#include "Errors.hpp"
#include "Network.hpp"
#include "Payoffs.hpp"
#include "Strategies.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

inline bool isProbability(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

// Immutable once built. A model run with other values needs a new instance.
class ModelParameters {
public:
    ModelParameters(std::shared_ptr<const LearningStrategy> strategy,
                    std::shared_ptr<const PayoffModel> payoff,
                    double adoptionRate = 1.0,
                    double dropRate = 0.0,
                    DyadicRates dyadicRates = {},
                    UpdateMode updateMode = UpdateMode::Synchronous,
                    InteractionMode interactionMode = InteractionMode::RandomPartner)
        : strategyPtr(std::move(strategy)), payoffPtr(std::move(payoff)),
          alpha(adoptionRate), delta(dropRate), overrides(std::move(dyadicRates)),
          update(updateMode), interaction(interactionMode)
    {
        if (!strategyPtr) {
            throw InvalidParameter("Model parameters need a learning strategy");
        }
        if (!payoffPtr) {
            throw InvalidParameter("Model parameters need a payoff model");
        }
        if (!isProbability(alpha)) {
            throw InvalidParameter("Adoption rate must lie in [0, 1], got " + std::to_string(alpha));
        }
        if (!isProbability(delta)) {
            throw InvalidParameter("Drop rate must lie in [0, 1], got " + std::to_string(delta));
        }
        for (const auto& [dyad, rate] : overrides) {
            if (!isProbability(rate)) {
                throw InvalidParameter("Adoption rate for dyad (" + std::to_string(dyad.first) + ", " +
                                       std::to_string(dyad.second) + ") must lie in [0, 1]");
            }
        }
    }

    const LearningStrategy& strategy() const { return *strategyPtr; }
    const PayoffModel& payoff() const { return *payoffPtr; }
    double adoptionRate() const { return alpha; }
    double dropRate() const { return delta; }
    const DyadicRates& dyadicRates() const { return overrides; }
    UpdateMode updateMode() const { return update; }
    InteractionMode interactionMode() const { return interaction; }

private:
    std::shared_ptr<const LearningStrategy> strategyPtr;
    std::shared_ptr<const PayoffModel> payoffPtr;
    double alpha;
    double delta;
    DyadicRates overrides;
    UpdateMode update;
    InteractionMode interaction;
};

struct PayoffSpec {
    std::string kind = "fixed";
    std::vector<double> values = {1.0, 1.0};
};

// Everything needed to build one model, see buildModel() in Model.hpp
struct ModelConfig {
    Network network;
    std::string strategy = "contagion";
    double adoptionRate = 1.0;
    double dropRate = 0.0;
    PayoffSpec payoff;
    std::vector<size_t> initialAdopters;
    double slope = 1.0; // success or conformity bias exponent
    DyadicRates dyadicRates;
    UpdateMode updateMode = UpdateMode::Synchronous;
    InteractionMode interactionMode = InteractionMode::RandomPartner;
};

// Ordered named value lists. The last parameter varies fastest.
using ParameterGrid = std::vector<std::pair<std::string, std::vector<ParamValue>>>;

inline void validateGrid(const ParameterGrid& grid) {
    std::unordered_set<std::string> seen;
    for (const auto& [name, values] : grid) {
        if (name.empty() || name.find_first_of("=;\t\n") != std::string::npos) {
            throw ConfigurationError("Invalid parameter name '" + name + "'");
        }
        if (!seen.insert(name).second) {
            throw ConfigurationError("Parameter '" + name + "' appears twice in the grid");
        }
        if (values.empty()) {
            throw ConfigurationError("Parameter '" + name + "' has no values");
        }
        // Repeated values would give two combinations the same checkpoint key
        std::set<ParamValue> distinct;
        for (const auto& value : values) {
            if (const auto* text = std::get_if<std::string>(&value)) {
                if (text->find_first_of(";\t\n") != std::string::npos) {
                    throw ConfigurationError("Invalid value '" + *text + "' for parameter '" + name + "'");
                }
            } else if (!std::isfinite(std::get<double>(value))) {
                throw ConfigurationError("Parameter '" + name + "' has a non-finite value");
            }
            if (!distinct.insert(value).second) {
                throw ConfigurationError("Parameter '" + name + "' lists the same value twice");
            }
        }
    }
}

inline std::vector<ParamCombination> makeCombinations(const ParameterGrid& grid) {
    validateGrid(grid);

    std::vector<ParamCombination> combinations;
    if (grid.empty()) {
        return combinations;
    }

    size_t total = 1;
    for (const auto& entry : grid) {
        total *= entry.second.size();
    }
    combinations.reserve(total);

    // Mixed-radix counter over the grid, last digit fastest
    std::vector<size_t> digits(grid.size(), 0);
    for (size_t count = 0; count < total; ++count) {
        ParamCombination combination;
        for (size_t p = 0; p < grid.size(); ++p) {
            combination[grid[p].first] = grid[p].second[digits[p]];
        }
        combinations.push_back(std::move(combination));

        for (size_t p = grid.size(); p-- > 0;) {
            if (++digits[p] < grid[p].second.size()) {
                break;
            }
            digits[p] = 0;
        }
    }
    return combinations;
}

inline double numericParam(const ParamCombination& combination, const std::string& name) {
    auto it = combination.find(name);
    if (it == combination.end()) {
        throw ConfigurationError("Missing parameter '" + name + "'");
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    throw ConfigurationError("Parameter '" + name + "' is not numeric");
}

inline std::string stringParam(const ParamCombination& combination, const std::string& name) {
    auto it = combination.find(name);
    if (it == combination.end()) {
        throw ConfigurationError("Missing parameter '" + name + "'");
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    throw ConfigurationError("Parameter '" + name + "' is not a string");
}

// Sweep used by the command-line tool
inline ParameterGrid makeDefaultGrid() {
    std::vector<ParamValue> strategies = {
        std::string("success"),
        std::string("frequency"),
        std::string("contagion")
    };

    return {
        {"strategy", strategies},
        {"adoption_rate", {0.2, 0.5, 0.8, 1.0}},
        {"drop_rate", {0.0, 0.05}},
        {"adaptive_fitness", {1.2, 2.0}}
    };
}

#endif // PARAMS_HPP
