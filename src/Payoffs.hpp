#ifndef PAYOFFS_HPP
#define PAYOFFS_HPP

#include "Types.hpp"

#include <memory>
#include <string>
#include <vector>

// Fitness of a focal agent. Dyad-dependent models also need the behavior of
// the partner the agent interacted with this step.
class PayoffModel {
public:
    virtual ~PayoffModel() = default;

    virtual std::string name() const = 0;
    virtual bool isDyadic() const = 0;
    virtual double payoff(Behavior own) const = 0;
    virtual double payoff(Behavior own, Behavior partner) const = 0;
};

// Dyad-independent: fitness depends on the agent's own behavior only
class FixedPayoff : public PayoffModel {
public:
    FixedPayoff(double legacyFitness, double adaptiveFitness);
    explicit FixedPayoff(const std::vector<double>& fitnessByBehavior);

    std::string name() const override { return "fixed"; }
    bool isDyadic() const override { return false; }
    double payoff(Behavior own) const override;
    double payoff(Behavior own, Behavior partner) const override;

private:
    std::vector<double> fitness;
};

// Dyad-dependent: table[own][partner]
class PayoffTable : public PayoffModel {
public:
    PayoffTable(std::string tableName, std::vector<std::vector<double>> table);

    std::string name() const override { return tableName; }
    bool isDyadic() const override { return true; }
    double payoff(Behavior own) const override;
    double payoff(Behavior own, Behavior partner) const override;

    const std::vector<std::vector<double>>& entries() const { return table; }

private:
    std::string tableName;
    std::vector<std::vector<double>> table;
};

// Cooperation dilemma with Cooperate = Adaptive and Defect = Legacy.
// Requires temptation > reward > punishment > sucker.
std::shared_ptr<const PayoffModel> makeDilemmaPayoff(double temptation, double reward,
                                                     double punishment, double sucker);

// compatible[own][partner] is true when the two roles complement each other
std::shared_ptr<const PayoffModel> makeComplementaryPayoff(
    const std::vector<std::vector<bool>>& compatible, double high, double low);

// "fixed" {legacy, adaptive}, "dilemma" {T, R, P, S}, "complementary" {high, low}
std::shared_ptr<const PayoffModel> makePayoff(const std::string& kind,
                                              const std::vector<double>& values);

#endif // PAYOFFS_HPP
