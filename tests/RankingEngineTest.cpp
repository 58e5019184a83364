#include "swissim/core/stats/RankingEngine.h"

#include "TestFields.h"

#include <gtest/gtest.h>

#include <set>

namespace {

using swissim::core::stats::CountTiedForFirst;
using swissim::core::stats::TiebreakRanking;
using swissim::core::stats::UpdateOpponentWinPercentages;
using swissim::core::tournament::Competitor;

Competitor Make(int id, int wins, int losses, int draws, std::vector<int> opponents) {
    Competitor competitor;
    competitor.id = id;
    competitor.wins = wins;
    competitor.losses = losses;
    competitor.draws = draws;
    competitor.points = 3 * wins + draws;
    competitor.opponents = std::move(opponents);
    return competitor;
}

TEST(RankingEngineTest, OpponentWinPercentageAveragesOpponentRecords) {
    std::vector<Competitor> field = {
        Make(0, 1, 1, 0, {1, 2}),
        Make(1, 2, 0, 0, {0, 2}),
        Make(2, 0, 1, 1, {1, 0}),
        Make(3, 0, 0, 0, {}),
    };
    UpdateOpponentWinPercentages(field);

    // Opponent 1 is 2-0 (1.0), opponent 2 is 0-1-1 (0.25).
    EXPECT_DOUBLE_EQ(field[0].opponent_win_percentage, 0.625);
    EXPECT_DOUBLE_EQ(field[1].opponent_win_percentage, (0.5 + 0.25) / 2.0);
    EXPECT_DOUBLE_EQ(field[3].opponent_win_percentage, 0.0);
}

TEST(RankingEngineTest, UnplayedAndUnknownOpponentsContributeZero) {
    std::vector<Competitor> field = {
        Make(0, 1, 0, 0, {1, 42}),
        Make(1, 0, 0, 0, {}),
    };
    UpdateOpponentWinPercentages(field);
    EXPECT_DOUBLE_EQ(field[0].opponent_win_percentage, 0.0);
}

TEST(RankingEngineTest, OrdersByPointsThenOpponentWinPercentageThenId) {
    std::vector<Competitor> field = {
        Make(0, 1, 1, 0, {2, 3}),
        Make(1, 1, 1, 0, {3, 2}),
        Make(2, 2, 0, 0, {0, 1}),
        Make(3, 0, 2, 0, {1, 0}),
        Make(4, 1, 1, 0, {6, 3}),
        Make(5, 1, 0, 0, {2}),
        Make(6, 0, 1, 0, {4}),
    };
    TiebreakRanking ranking;
    const auto ranked = ranking.Rank(field);

    ASSERT_EQ(ranked.size(), field.size());
    EXPECT_EQ(ranked[0].id, 2);
    // Among the 3-point group 5 faced the strongest opponent and 4 the weakest;
    // 0 and 1 faced the same opponents, so id decides.
    EXPECT_EQ(ranked[1].id, 5);
    EXPECT_EQ(ranked[2].id, 0);
    EXPECT_EQ(ranked[3].id, 1);
    EXPECT_EQ(ranked[4].id, 4);

    // The input field receives the refreshed tiebreak values.
    EXPECT_DOUBLE_EQ(field[0].opponent_win_percentage, 0.5);
}

TEST(RankingEngineTest, RankingIsAStrictTotalOrder) {
    std::vector<Competitor> field = swissim::test::FieldOf({{6, 3}, {6, 3}});
    TiebreakRanking ranking;
    const auto ranked = ranking.Rank(field);
    std::set<int> ids;
    for (size_t i = 0; i < ranked.size(); ++i) {
        EXPECT_TRUE(ids.insert(ranked[i].id).second);
        if (i > 0) {
            EXPECT_LT(ranked[i - 1].id, ranked[i].id);
        }
    }
}

TEST(RankingEngineTest, CountsCompetitorsTiedForFirst) {
    EXPECT_EQ(CountTiedForFirst({}), 0);
    EXPECT_EQ(CountTiedForFirst(swissim::test::FieldOf({{1, 9}, {3, 6}})), 1);
    EXPECT_EQ(CountTiedForFirst(swissim::test::FieldOf({{2, 9}, {3, 6}})), 2);
}

}  // namespace
