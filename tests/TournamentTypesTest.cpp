#include "swissim/core/tournament/TournamentTypes.h"

#include <gtest/gtest.h>

namespace {

using swissim::core::tournament::Competitor;
using swissim::core::tournament::FindCompetitor;
using swissim::core::tournament::MakeField;
using swissim::core::tournament::Record;

TEST(TournamentTypesTest, MakeFieldAssignsDenseIds) {
    const auto field = MakeField(5);
    ASSERT_EQ(field.size(), 5u);
    for (size_t i = 0; i < field.size(); ++i) {
        EXPECT_EQ(field[i].id, static_cast<int>(i));
    }
    EXPECT_TRUE(MakeField(0).empty());
    EXPECT_TRUE(MakeField(-3).empty());
}

TEST(TournamentTypesTest, FindCompetitorOnDenseField) {
    const auto field = MakeField(4);
    for (int id = 0; id < 4; ++id) {
        const auto* found = FindCompetitor(field, id);
        ASSERT_NE(found, nullptr);
        EXPECT_EQ(found, &field[static_cast<size_t>(id)]);
    }
    EXPECT_EQ(FindCompetitor(field, 4), nullptr);
    EXPECT_EQ(FindCompetitor(field, -1), nullptr);
}

TEST(TournamentTypesTest, FindCompetitorWhenIdsAreNotIndices) {
    // Ranked copies hold competitors out of id order.
    std::vector<Competitor> field(3);
    field[0].id = 2;
    field[1].id = 0;
    field[2].id = 7;

    const auto* zero = FindCompetitor(field, 0);
    ASSERT_NE(zero, nullptr);
    EXPECT_EQ(zero, &field[1]);
    EXPECT_EQ(FindCompetitor(field, 2), &field[0]);
    EXPECT_EQ(FindCompetitor(field, 7), &field[2]);
    EXPECT_EQ(FindCompetitor(field, 1), nullptr);
}

TEST(TournamentTypesTest, RecordLabelShowsDrawsOnlyWhenPresent) {
    EXPECT_EQ((Record{3, 2, 0}).Label(), "3-2");
    EXPECT_EQ((Record{4, 0, 1}).Label(), "4-0-1");
    EXPECT_EQ((Record{4, 0, 1}).Points(), 13);
}

}  // namespace
