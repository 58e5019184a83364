#pragma once

#include "swissim/core/tournament/TournamentTypes.h"

#include <vector>

namespace swissim::core::stats {

// Competitors are stored at the index equal to their id.
class StandingsTable {
public:
    explicit StandingsTable(int competitor_count);

    bool RecordOutcome(const tournament::MatchOutcome& outcome);

    const std::vector<tournament::Competitor>& competitors() const { return competitors_; }
    std::vector<tournament::Competitor>& mutable_competitors() { return competitors_; }
    const tournament::Competitor* Find(int id) const;
    int matches_played() const { return matches_played_; }

private:
    tournament::Competitor* FindMutable(int id);

    std::vector<tournament::Competitor> competitors_;
    int matches_played_ = 0;
};

}  // namespace swissim::core::stats
