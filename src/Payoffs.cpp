#include "Payoffs.hpp"
#include "Errors.hpp"

#include <cmath>
#include <utility>

namespace {

void checkEntry(double value, const std::string& what) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidPayoffSpec(what + " must be a finite, non-negative fitness, got " +
                                std::to_string(value));
    }
}

void checkValueCount(const std::string& kind, const std::vector<double>& values, size_t expected) {
    if (values.size() != expected) {
        throw InvalidPayoffSpec("Payoff '" + kind + "' takes " + std::to_string(expected) +
                                " values, got " + std::to_string(values.size()));
    }
}

} // namespace

FixedPayoff::FixedPayoff(double legacyFitness, double adaptiveFitness)
    : FixedPayoff(std::vector<double>{legacyFitness, adaptiveFitness}) {}

FixedPayoff::FixedPayoff(const std::vector<double>& fitnessByBehavior)
    : fitness(fitnessByBehavior)
{
    if (fitness.size() != kNumBehaviors) {
        throw InvalidPayoffSpec("Fixed payoff needs one fitness per behavior, got " +
                                std::to_string(fitness.size()));
    }
    for (size_t behavior = 0; behavior < fitness.size(); ++behavior) {
        checkEntry(fitness[behavior], "Fixed payoff entry " + std::to_string(behavior));
    }
}

double FixedPayoff::payoff(Behavior own) const {
    return fitness[own];
}

double FixedPayoff::payoff(Behavior own, Behavior /*partner*/) const {
    return fitness[own];
}

PayoffTable::PayoffTable(std::string tableName, std::vector<std::vector<double>> table)
    : tableName(std::move(tableName)), table(std::move(table))
{
    if (this->table.size() != kNumBehaviors) {
        throw InvalidPayoffSpec("Payoff table '" + this->tableName + "' has " +
                                std::to_string(this->table.size()) + " rows, expected " +
                                std::to_string(kNumBehaviors));
    }
    for (size_t own = 0; own < this->table.size(); ++own) {
        if (this->table[own].size() != kNumBehaviors) {
            throw InvalidPayoffSpec("Payoff table '" + this->tableName + "' row " +
                                    std::to_string(own) + " does not cover every partner behavior");
        }
        for (size_t partner = 0; partner < kNumBehaviors; ++partner) {
            checkEntry(this->table[own][partner], "Payoff table '" + this->tableName + "' entry (" +
                                                      std::to_string(own) + ", " +
                                                      std::to_string(partner) + ")");
        }
    }
}

double PayoffTable::payoff(Behavior /*own*/) const {
    throw RuntimeInvariantError("Payoff table '" + tableName + "' needs an interaction partner");
}

double PayoffTable::payoff(Behavior own, Behavior partner) const {
    return table[own][partner];
}

std::shared_ptr<const PayoffModel> makeDilemmaPayoff(double temptation, double reward,
                                                     double punishment, double sucker) {
    if (!(temptation > reward && reward > punishment && punishment > sucker)) {
        throw InvalidPayoffSpec("Dilemma payoffs must satisfy T > R > P > S");
    }
    std::vector<std::vector<double>> table(kNumBehaviors, std::vector<double>(kNumBehaviors));
    table[Behavior::Adaptive][Behavior::Adaptive] = reward;
    table[Behavior::Adaptive][Behavior::Legacy] = sucker;
    table[Behavior::Legacy][Behavior::Adaptive] = temptation;
    table[Behavior::Legacy][Behavior::Legacy] = punishment;
    return std::make_shared<PayoffTable>("dilemma", std::move(table));
}

std::shared_ptr<const PayoffModel> makeComplementaryPayoff(
    const std::vector<std::vector<bool>>& compatible, double high, double low) {
    if (!(high > low)) {
        throw InvalidPayoffSpec("Complementary payoff needs high > low");
    }
    if (compatible.size() != kNumBehaviors) {
        throw InvalidPayoffSpec("Role compatibility matrix must cover every role");
    }
    std::vector<std::vector<double>> table(kNumBehaviors, std::vector<double>(kNumBehaviors));
    for (size_t own = 0; own < kNumBehaviors; ++own) {
        if (compatible[own].size() != kNumBehaviors) {
            throw InvalidPayoffSpec("Role compatibility row " + std::to_string(own) +
                                    " does not cover every partner role");
        }
        for (size_t partner = 0; partner < kNumBehaviors; ++partner) {
            table[own][partner] = compatible[own][partner] ? high : low;
        }
    }
    return std::make_shared<PayoffTable>("complementary", std::move(table));
}

std::shared_ptr<const PayoffModel> makePayoff(const std::string& kind,
                                              const std::vector<double>& values) {
    if (kind == "fixed") {
        checkValueCount(kind, values, 2);
        return std::make_shared<FixedPayoff>(values[0], values[1]);
    }
    if (kind == "dilemma") {
        checkValueCount(kind, values, 4);
        return makeDilemmaPayoff(values[0], values[1], values[2], values[3]);
    }
    if (kind == "complementary") {
        checkValueCount(kind, values, 2);
        // Two roles complement each other exactly when they differ
        std::vector<std::vector<bool>> compatible = {{false, true}, {true, false}};
        return makeComplementaryPayoff(compatible, values[0], values[1]);
    }
    throw InvalidPayoffSpec("Unknown payoff model '" + kind + "'");
}
