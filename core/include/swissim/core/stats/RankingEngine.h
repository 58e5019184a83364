#pragma once

#include "swissim/core/tournament/TournamentTypes.h"

#include <vector>

namespace swissim::core::stats {

class IRankingEngine {
public:
    virtual ~IRankingEngine() = default;
    // Refreshes opponent_win_percentage on |competitors| and returns a ranked copy.
    virtual std::vector<tournament::Competitor> Rank(std::vector<tournament::Competitor>& competitors) const = 0;
};

// Orders by points desc, opponent win percentage desc, then id asc.
class TiebreakRanking final : public IRankingEngine {
public:
    std::vector<tournament::Competitor> Rank(std::vector<tournament::Competitor>& competitors) const override;
};

void UpdateOpponentWinPercentages(std::vector<tournament::Competitor>& competitors);
int CountTiedForFirst(const std::vector<tournament::Competitor>& ranked);

}  // namespace swissim::core::stats
