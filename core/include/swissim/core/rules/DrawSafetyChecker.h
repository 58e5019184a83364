#pragma once

#include "swissim/core/tournament/TournamentTypes.h"

#include <vector>

namespace swissim::core::rules {

class IDrawSafetyChecker {
public:
    virtual ~IDrawSafetyChecker() = default;
    // True when a draw between |first| and |second| cannot cost either of them
    // a cut slot, whatever the rest of the field does.
    virtual bool IsSafe(const tournament::Competitor& first,
                        const tournament::Competitor& second,
                        const std::vector<tournament::Competitor>& field,
                        int cut_size,
                        int current_round,
                        int total_rounds) const = 0;
};

// Final round: both post-draw scores must beat the best score the first
// non-qualifier can reach. Earlier rounds: both must still beat the Swiss
// constrained projection after drawing out, and every score level of the
// draw-safe set must hold an even count so that set keeps pairing inside itself.
class SwissProjectionChecker final : public IDrawSafetyChecker {
public:
    bool IsSafe(const tournament::Competitor& first,
                const tournament::Competitor& second,
                const std::vector<tournament::Competitor>& field,
                int cut_size,
                int current_round,
                int total_rounds) const override;

    // Advances ceil(n/2) of every score group by a win each round, the rest
    // by nothing, and returns the score at |rank_index| of the result
    // (descending). Returns -1 when the field has no such rank.
    static int ProjectThreshold(const std::vector<int>& scores, int rounds, int rank_index);

    static bool HasEvenScoreLevels(const std::vector<tournament::Competitor>& field,
                                   int rounds_remaining,
                                   int threshold);
};

}  // namespace swissim::core::rules
