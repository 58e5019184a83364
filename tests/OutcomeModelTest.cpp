#include "swissim/core/game/OutcomeModel.h"

#include "TestFields.h"

#include <gtest/gtest.h>

namespace {

using swissim::core::game::RandomOutcomeModel;
using swissim::core::rules::IDrawSafetyChecker;
using swissim::core::tournament::Competitor;
using swissim::core::tournament::OutcomeKind;
using swissim::core::tournament::Pairing;
using swissim::core::tournament::RoundContext;

class FixedChecker final : public IDrawSafetyChecker {
public:
    explicit FixedChecker(bool safe) : safe_(safe) {}

    bool IsSafe(const Competitor&,
                const Competitor&,
                const std::vector<Competitor>&,
                int,
                int,
                int) const override {
        ++calls_;
        return safe_;
    }

    int calls() const { return calls_; }

private:
    bool safe_ = false;
    mutable int calls_ = 0;
};

Pairing Pair(int first, int second) {
    Pairing pairing;
    pairing.first_id = first;
    pairing.second_id = second;
    return pairing;
}

RoundContext Context(int current_round, bool allow_ids, double draw_chance) {
    RoundContext context;
    context.current_round = current_round;
    context.total_rounds = 5;
    context.cut_size = 8;
    context.allow_intentional_draws = allow_ids;
    context.draw_chance_percent = draw_chance;
    return context;
}

class OutcomeModelTest : public ::testing::Test {
protected:
    std::vector<Competitor> field_ = swissim::test::FieldOf({{4, 6}});
};

TEST_F(OutcomeModelTest, ByeGoesToTheUnpairedCompetitor) {
    auto checker = std::make_shared<FixedChecker>(true);
    RandomOutcomeModel model(checker);
    Pairing bye;
    bye.first_id = 3;

    const auto outcome = model.Decide(bye, field_, 0.0, Context(5, true, 50.0));
    EXPECT_EQ(outcome.kind, OutcomeKind::Bye);
    EXPECT_EQ(outcome.winner_id, 3);
    EXPECT_EQ(outcome.loser_id, -1);
    EXPECT_FALSE(outcome.second_id.has_value());
    EXPECT_EQ(checker->calls(), 0);
}

TEST_F(OutcomeModelTest, SafePairTakesIntentionalDrawInWindow) {
    auto checker = std::make_shared<FixedChecker>(true);
    RandomOutcomeModel model(checker);

    for (int round : {4, 5}) {
        const auto outcome = model.Decide(Pair(0, 1), field_, 99.0, Context(round, true, 0.0));
        EXPECT_TRUE(outcome.is_intentional_draw()) << round;
    }
    EXPECT_EQ(checker->calls(), 2);
}

TEST_F(OutcomeModelTest, ChecksSafetyOnlyInsideWindow) {
    auto checker = std::make_shared<FixedChecker>(true);
    RandomOutcomeModel model(checker);

    const auto outcome = model.Decide(Pair(0, 1), field_, 10.0, Context(3, true, 0.0));
    EXPECT_EQ(outcome.kind, OutcomeKind::Win);
    EXPECT_EQ(checker->calls(), 0);
}

TEST_F(OutcomeModelTest, DisabledIntentionalDrawsSkipChecker) {
    auto checker = std::make_shared<FixedChecker>(true);
    RandomOutcomeModel model(checker);

    const auto outcome = model.Decide(Pair(0, 1), field_, 80.0, Context(5, false, 0.0));
    EXPECT_EQ(outcome.kind, OutcomeKind::Win);
    EXPECT_FALSE(outcome.intentional);
    EXPECT_EQ(checker->calls(), 0);
}

TEST_F(OutcomeModelTest, UnsafePairFallsBackToRandomResult) {
    auto checker = std::make_shared<FixedChecker>(false);
    RandomOutcomeModel model(checker);

    const auto outcome = model.Decide(Pair(0, 1), field_, 5.0, Context(5, true, 10.0));
    EXPECT_EQ(outcome.kind, OutcomeKind::Draw);
    EXPECT_FALSE(outcome.intentional);
    EXPECT_EQ(checker->calls(), 1);
}

TEST_F(OutcomeModelTest, RandomValueSplitsDrawAndWins) {
    RandomOutcomeModel model(std::make_shared<FixedChecker>(false));
    const auto context = Context(1, false, 10.0);

    EXPECT_TRUE(model.Decide(Pair(0, 1), field_, 9.99, context).is_draw());

    const auto first_wins = model.Decide(Pair(0, 1), field_, 54.9, context);
    EXPECT_EQ(first_wins.kind, OutcomeKind::Win);
    EXPECT_EQ(first_wins.winner_id, 0);
    EXPECT_EQ(first_wins.loser_id, 1);

    const auto second_wins = model.Decide(Pair(0, 1), field_, 55.0, context);
    EXPECT_EQ(second_wins.winner_id, 1);
    EXPECT_EQ(second_wins.loser_id, 0);
}

TEST_F(OutcomeModelTest, ZeroDrawChanceNeverDraws) {
    RandomOutcomeModel model;
    const auto context = Context(1, false, 0.0);

    const auto low = model.Decide(Pair(2, 3), field_, 0.0, context);
    EXPECT_EQ(low.kind, OutcomeKind::Win);
    EXPECT_EQ(low.winner_id, 2);
    EXPECT_EQ(model.Decide(Pair(2, 3), field_, 49.99, context).winner_id, 2);
    EXPECT_EQ(model.Decide(Pair(2, 3), field_, 50.0, context).winner_id, 3);
}

TEST_F(OutcomeModelTest, FullDrawChanceAlwaysDraws) {
    RandomOutcomeModel model;
    const auto context = Context(1, false, 100.0);
    EXPECT_TRUE(model.Decide(Pair(0, 1), field_, 99.999, context).is_draw());
}

}  // namespace
