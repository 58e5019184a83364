#include "swissim/core/stats/RankingEngine.h"

#include <algorithm>
#include <unordered_map>

namespace swissim::core::stats {

using tournament::Competitor;

void UpdateOpponentWinPercentages(std::vector<Competitor>& competitors) {
    std::unordered_map<int, double> win_rate_by_id;
    win_rate_by_id.reserve(competitors.size());
    for (const auto& competitor : competitors) {
        win_rate_by_id[competitor.id] = competitor.match_win_rate();
    }

    for (auto& competitor : competitors) {
        if (competitor.opponents.empty()) {
            competitor.opponent_win_percentage = 0.0;
            continue;
        }
        double total = 0.0;
        for (int opponent_id : competitor.opponents) {
            const auto it = win_rate_by_id.find(opponent_id);
            if (it != win_rate_by_id.end()) {
                total += it->second;
            }
        }
        competitor.opponent_win_percentage = total / static_cast<double>(competitor.opponents.size());
    }
}

std::vector<Competitor> TiebreakRanking::Rank(std::vector<Competitor>& competitors) const {
    UpdateOpponentWinPercentages(competitors);

    std::vector<Competitor> ranked = competitors;
    std::sort(ranked.begin(), ranked.end(), [](const Competitor& a, const Competitor& b) {
        if (a.points != b.points) {
            return a.points > b.points;
        }
        if (a.opponent_win_percentage != b.opponent_win_percentage) {
            return a.opponent_win_percentage > b.opponent_win_percentage;
        }
        return a.id < b.id;
    });
    return ranked;
}

int CountTiedForFirst(const std::vector<Competitor>& ranked) {
    if (ranked.empty()) {
        return 0;
    }
    const int top_points = ranked.front().points;
    int count = 0;
    for (const auto& competitor : ranked) {
        if (competitor.points != top_points) {
            break;
        }
        ++count;
    }
    return count;
}

}  // namespace swissim::core::stats
