#include "swissim/core/rules/DrawSafetyChecker.h"

#include "TestFields.h"

#include <gtest/gtest.h>

namespace {

using swissim::core::rules::SwissProjectionChecker;
using swissim::core::tournament::Competitor;
using swissim::test::FieldOf;

constexpr int kCut = 8;
constexpr int kRounds = 5;

bool CheckFirstTwo(const std::vector<Competitor>& field, int current_round, int cut = kCut) {
    SwissProjectionChecker checker;
    return checker.IsSafe(field[0], field[1], field, cut, current_round, kRounds);
}

TEST(DrawSafetyCheckerTest, FinalRoundLeadersAboveCutlineAreSafe) {
    // 4 on 9, 10 on 6, 12 on 3: the best non-qualifier finishes on 9.
    EXPECT_TRUE(CheckFirstTwo(FieldOf({{4, 9}, {10, 6}, {12, 3}}), 5));
}

TEST(DrawSafetyCheckerTest, FinalRoundDrawCanBeCaughtByThreats) {
    // Seven others on 9: the last of them can still reach 12.
    EXPECT_FALSE(CheckFirstTwo(FieldOf({{2, 9}, {7, 9}, {21, 6}}), 5));
}

TEST(DrawSafetyCheckerTest, FinalRoundExactlyAtThreatCountIsUnsafe) {
    std::vector<Competitor> field = FieldOf({{1, 12}, {16, 9}, {15, 3}});
    SwissProjectionChecker checker;
    EXPECT_FALSE(checker.IsSafe(field[1], field[2], field, kCut, 5, kRounds));
}

TEST(DrawSafetyCheckerTest, MismatchedScoresNeedBothSidesSafe) {
    std::vector<Competitor> field = FieldOf({{2, 0}, {7, 10}, {23, 3}});
    field[0].points = 13;
    field[1].points = 10;
    EXPECT_FALSE(CheckFirstTwo(field, 5));
}

TEST(DrawSafetyCheckerTest, PenultimateRoundLeadersAreSafe) {
    EXPECT_TRUE(CheckFirstTwo(FieldOf({{4, 12}, {12, 6}, {16, 3}}), 4));
}

TEST(DrawSafetyCheckerTest, PenultimateRoundUsesSwissProjection) {
    // The projected cutline after one more round stays on 9.
    EXPECT_TRUE(CheckFirstTwo(FieldOf({{4, 9}, {10, 6}, {12, 3}}), 4));
}

TEST(DrawSafetyCheckerTest, OddScoreLevelInDrawSafeSetIsUnsafe) {
    EXPECT_FALSE(CheckFirstTwo(FieldOf({{3, 12}, {11, 6}, {12, 3}}), 4));
}

TEST(DrawSafetyCheckerTest, ParityCountsThePairItself) {
    // The others alone hold an even group on 12; with the pair added the
    // draw-safe set has one competitor on 13 and three on 12.
    std::vector<Competitor> field = FieldOf({{2, 0}, {2, 12}, {10, 6}, {12, 3}});
    field[0].points = 13;
    field[1].points = 12;
    EXPECT_FALSE(CheckFirstTwo(field, 4));
}

TEST(DrawSafetyCheckerTest, EarlyRoundIsUnsafeForCrowdedField) {
    EXPECT_FALSE(CheckFirstTwo(FieldOf({{4, 3}, {28, 0}}), 2));
}

TEST(DrawSafetyCheckerTest, SmallFieldIsAlwaysSafe) {
    EXPECT_TRUE(CheckFirstTwo(FieldOf({{6, 0}}), 1));
}

TEST(DrawSafetyCheckerTest, CutBelowTwoIsNeverSafe) {
    const auto field = FieldOf({{2, 12}, {10, 0}});
    EXPECT_FALSE(CheckFirstTwo(field, 5, 1));
    EXPECT_FALSE(CheckFirstTwo(field, 5, 0));
}

TEST(DrawSafetyCheckerTest, ProjectThresholdAdvancesHalfOfEachGroup) {
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({9, 9, 9, 9}, 1, 0), 12);
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({9, 9, 9, 9}, 1, 2), 9);
    // Odd group of three sends two up.
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({3, 3, 3}, 1, 1), 6);
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({3, 3, 3}, 1, 2), 3);
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({6, 3, 3, 0, 0, 0, 0}, 2, 1), 9);
}

TEST(DrawSafetyCheckerTest, ProjectThresholdRejectsMissingRank) {
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({3, 3}, 1, 2), -1);
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({3, 3}, 1, -1), -1);
    EXPECT_EQ(SwissProjectionChecker::ProjectThreshold({}, 3, 0), -1);
}

TEST(DrawSafetyCheckerTest, EvenScoreLevels) {
    EXPECT_TRUE(SwissProjectionChecker::HasEvenScoreLevels(FieldOf({{2, 12}, {4, 9}, {3, 3}}), 1, 9));
    EXPECT_FALSE(SwissProjectionChecker::HasEvenScoreLevels(FieldOf({{2, 12}, {3, 9}, {3, 3}}), 1, 9));
}

}  // namespace
