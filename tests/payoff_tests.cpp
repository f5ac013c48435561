#include <gtest/gtest.h>
#include "Errors.hpp"
#include "Payoffs.hpp"

TEST(PayoffTest, FixedPayoffIgnoresPartner) {
    FixedPayoff payoff(1.0, 4.0);

    EXPECT_FALSE(payoff.isDyadic());
    EXPECT_DOUBLE_EQ(payoff.payoff(Behavior::Legacy), 1.0);
    EXPECT_DOUBLE_EQ(payoff.payoff(Behavior::Adaptive), 4.0);
    EXPECT_DOUBLE_EQ(payoff.payoff(Behavior::Adaptive, Behavior::Legacy), 4.0);
}

TEST(PayoffTest, FixedPayoffValidation) {
    EXPECT_THROW(FixedPayoff(-1.0, 1.0), InvalidPayoffSpec);
    EXPECT_THROW(FixedPayoff(std::vector<double>{1.0}), InvalidPayoffSpec);
}

// Cooperate is Adaptive, Defect is Legacy
TEST(PayoffTest, DilemmaTable) {
    auto payoff = makeDilemmaPayoff(5.0, 3.0, 1.0, 0.0);

    EXPECT_TRUE(payoff->isDyadic());
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Adaptive, Behavior::Adaptive), 3.0);
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Adaptive, Behavior::Legacy), 0.0);
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Legacy, Behavior::Adaptive), 5.0);
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Legacy, Behavior::Legacy), 1.0);
}

TEST(PayoffTest, DilemmaOrderingIsEnforced) {
    EXPECT_THROW(makeDilemmaPayoff(3.0, 5.0, 1.0, 0.0), InvalidPayoffSpec);
    EXPECT_THROW(makeDilemmaPayoff(5.0, 3.0, 3.0, 0.0), InvalidPayoffSpec);
    // Fitness stays non-negative
    EXPECT_THROW(makeDilemmaPayoff(5.0, 3.0, 1.0, -1.0), InvalidPayoffSpec);
}

TEST(PayoffTest, ComplementaryRolesPayWhenDifferent) {
    auto payoff = makePayoff("complementary", {2.0, 0.0});

    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Legacy, Behavior::Adaptive), 2.0);
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Adaptive, Behavior::Legacy), 2.0);
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Legacy, Behavior::Legacy), 0.0);
    EXPECT_DOUBLE_EQ(payoff->payoff(Behavior::Adaptive, Behavior::Adaptive), 0.0);
}

TEST(PayoffTest, ComplementaryCompatibilityMustCoverRoles) {
    EXPECT_THROW(makeComplementaryPayoff({{false, true}}, 2.0, 0.0), InvalidPayoffSpec);
    EXPECT_THROW(makeComplementaryPayoff({{false, true}, {true}}, 2.0, 0.0), InvalidPayoffSpec);
    EXPECT_THROW(makeComplementaryPayoff({{false, true}, {true, false}}, 0.0, 2.0), InvalidPayoffSpec);
}

TEST(PayoffTest, TableMustCoverEveryBehaviorPair) {
    EXPECT_THROW(PayoffTable("short", {{1.0, 2.0}}), InvalidPayoffSpec);
    EXPECT_THROW(PayoffTable("ragged", {{1.0, 2.0}, {3.0}}), InvalidPayoffSpec);
    EXPECT_NO_THROW(PayoffTable("ok", {{1.0, 2.0}, {3.0, 4.0}}));
}

TEST(PayoffTest, TableNeedsPartner) {
    PayoffTable table("ok", {{1.0, 2.0}, {3.0, 4.0}});
    EXPECT_THROW(table.payoff(Behavior::Legacy), RuntimeInvariantError);
}

TEST(PayoffTest, Registry) {
    EXPECT_EQ(makePayoff("fixed", {1.0, 2.0})->name(), "fixed");
    EXPECT_EQ(makePayoff("dilemma", {5.0, 3.0, 1.0, 0.0})->name(), "dilemma");
    EXPECT_THROW(makePayoff("fixed", {1.0}), InvalidPayoffSpec);
    EXPECT_THROW(makePayoff("lottery", {1.0, 2.0}), ConfigurationError);
}
