#pragma once

#include "swissim/core/tournament/PairingEngine.h"

namespace swissim::core::tournament {

// Pairs down the (-points, id) order: each unpaired competitor takes the next
// unpaired one below it. The last competitor of an odd field gets the bye.
class SwissPairing final : public IPairingEngine {
public:
    std::vector<Pairing> PairRound(const std::vector<Competitor>& competitors) const override;

    static std::vector<const Competitor*> PairingOrder(const std::vector<Competitor>& competitors);
};

}  // namespace swissim::core::tournament
