#pragma once

#include "swissim/core/tournament/TournamentTypes.h"

#include <vector>

namespace swissim::core::tournament {

class IPairingEngine {
public:
    virtual ~IPairingEngine() = default;
    virtual std::vector<Pairing> PairRound(const std::vector<Competitor>& competitors) const = 0;
};

}  // namespace swissim::core::tournament
