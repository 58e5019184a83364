#include "swissim/core/tournament/SwissPairing.h"

#include <algorithm>

namespace swissim::core::tournament {

std::vector<const Competitor*> SwissPairing::PairingOrder(const std::vector<Competitor>& competitors) {
    std::vector<const Competitor*> order;
    order.reserve(competitors.size());
    for (const auto& competitor : competitors) {
        order.push_back(&competitor);
    }
    std::sort(order.begin(), order.end(), [](const Competitor* a, const Competitor* b) {
        if (a->points != b->points) {
            return a->points > b->points;
        }
        return a->id < b->id;
    });
    return order;
}

std::vector<Pairing> SwissPairing::PairRound(const std::vector<Competitor>& competitors) const {
    const auto order = PairingOrder(competitors);

    std::vector<Pairing> pairings;
    pairings.reserve((order.size() + 1) / 2);
    std::vector<bool> used(order.size(), false);
    for (size_t i = 0; i < order.size(); ++i) {
        if (used[i]) {
            continue;
        }
        used[i] = true;
        Pairing pairing;
        pairing.first_id = order[i]->id;
        for (size_t j = i + 1; j < order.size(); ++j) {
            if (!used[j]) {
                used[j] = true;
                pairing.second_id = order[j]->id;
                break;
            }
        }
        pairings.push_back(pairing);
    }
    return pairings;
}

}  // namespace swissim::core::tournament
