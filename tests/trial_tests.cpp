#include <gtest/gtest.h>
#include "Errors.hpp"
#include "Trial.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace {

AgentBasedModel completeModel(const std::string& strategy, size_t n, std::vector<size_t> adopters,
                              double adoptionRate, double dropRate) {
    ModelConfig config;
    config.network = Network::complete(n);
    config.strategy = strategy;
    config.adoptionRate = adoptionRate;
    config.dropRate = dropRate;
    config.initialAdopters = std::move(adopters);
    return buildModel(config);
}

// Pluggable strategy that breaks after a few calls
class FailingStrategy : public LearningStrategy {
public:
    Strategy kind() const override { return Strategy::Contagion; }
    std::string name() const override { return "failing"; }
    double adoptionProbability(const LearningContext&) const override { return 0.0; }
    std::optional<size_t> selectTeacher(const LearningContext&, Rng&) const override {
        throw std::runtime_error("teacher lookup failed");
    }
};

} // namespace

TEST(TrialTest, FixatesOnAdaptive) {
    Trial trial(completeModel("contagion", 10, {0, 1, 2, 3, 4}, 1.0, 0.0), 10000);
    Rng gen(42);
    const TrialResult& result = trial.run(gen);

    EXPECT_EQ(result.terminal, TerminalState::FixatedAdaptive);
    EXPECT_EQ(trial.state(), TerminalState::FixatedAdaptive);
    ASSERT_FALSE(result.series.empty());
    EXPECT_EQ(result.series.front().step, 0u);
    EXPECT_EQ(result.series.front().counts[Behavior::Adaptive], 5u);
    EXPECT_EQ(result.series.back().counts[Behavior::Adaptive], 10u);
    EXPECT_EQ(result.steps, result.series.size() - 1);
    EXPECT_EQ(result.steps, trial.model().step());
}

TEST(TrialTest, ZeroAdoptersFixateOnLegacy) {
    Trial trial(completeModel("frequency", 10, {}, 1.0, 0.3), 100);
    Rng gen(1);
    const TrialResult& result = trial.run(gen);

    EXPECT_EQ(result.terminal, TerminalState::FixatedLegacy);
    EXPECT_EQ(result.steps, 1u);
}

TEST(TrialTest, TimesOut) {
    // Nobody learns and nobody drops, the mixed state persists
    Trial trial(completeModel("contagion", 8, {0}, 0.0, 0.0), 5);
    Rng gen(1);
    const TrialResult& result = trial.run(gen);

    EXPECT_EQ(result.terminal, TerminalState::TimedOut);
    EXPECT_EQ(result.steps, 5u);
    EXPECT_EQ(result.series.size(), 6u);
    for (const auto& record : result.series) {
        EXPECT_EQ(record.counts[Behavior::Adaptive], 1u);
    }
}

// A model that already ran gets the full step budget and reports only the steps run here
TEST(TrialTest, StepsCountFromHandover) {
    AgentBasedModel model = completeModel("contagion", 8, {0}, 0.0, 0.0);
    Rng gen(1);
    for (int step = 0; step < 3; ++step) {
        model.advanceOneStep(gen);
    }

    Trial trial(std::move(model), 5);
    const TrialResult& result = trial.run(gen);

    EXPECT_EQ(result.terminal, TerminalState::TimedOut);
    EXPECT_EQ(result.steps, 5u);
    EXPECT_EQ(result.series.size(), 6u);
    EXPECT_EQ(result.series.front().step, 3u);
    EXPECT_EQ(result.series.back().step, 8u);
}

TEST(TrialTest, StopPredicate) {
    StopPredicate stop = [](const AgentBasedModel& model) {
        return model.counts()[Behavior::Adaptive] >= 10;
    };
    Trial trial(completeModel("contagion", 100, {0, 1}, 1.0, 0.0), 10000, stop);
    Rng gen(6);
    const TrialResult& result = trial.run(gen);

    EXPECT_EQ(result.terminal, TerminalState::Stopped);
    EXPECT_GE(result.series.back().counts[Behavior::Adaptive], 10u);
    EXPECT_LT(result.series[result.series.size() - 2].counts[Behavior::Adaptive], 10u);
}

TEST(TrialTest, StrategyErrorFailsTrial) {
    ModelParameters params(std::make_shared<FailingStrategy>(), makePayoff("fixed", {1.0, 1.0}));
    Trial trial(AgentBasedModel(Network::complete(5), params, {0}), 50);
    Rng gen(1);
    const TrialResult& result = trial.run(gen);

    EXPECT_EQ(result.terminal, TerminalState::Failed);
    EXPECT_EQ(result.error, "teacher lookup failed");
}

TEST(TrialTest, TerminalStateIsFinal) {
    Trial trial(completeModel("contagion", 6, {0, 1, 2}, 1.0, 0.0), 1000);
    Rng gen(4);
    TrialResult first = trial.run(gen);
    const TrialResult& second = trial.run(gen);

    EXPECT_EQ(second.terminal, first.terminal);
    EXPECT_EQ(second.steps, first.steps);
    EXPECT_EQ(second.series.size(), first.series.size());
}

TEST(TrialTest, NeedsPositiveStepBound) {
    EXPECT_THROW(Trial(completeModel("contagion", 4, {0}, 1.0, 0.0), 0), ConfigurationError);
}

TEST(TrialTest, TerminalStateNames) {
    for (TerminalState state : {Running, FixatedAdaptive, FixatedLegacy, TimedOut, Stopped, Failed}) {
        EXPECT_EQ(terminalFromString(terminalToString(state)), state);
    }
    EXPECT_THROW(terminalFromString("Exploded"), std::invalid_argument);
}
