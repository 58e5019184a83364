#include "swissim/core/rules/DrawSafetyChecker.h"

#include <algorithm>
#include <functional>
#include <map>

namespace swissim::core::rules {

using tournament::Competitor;

namespace {

bool CanDrawOut(int points, int rounds_remaining, int threshold) {
    return points + rounds_remaining * tournament::kDrawPoints > threshold;
}

}  // namespace

int SwissProjectionChecker::ProjectThreshold(const std::vector<int>& scores, int rounds, int rank_index) {
    if (rank_index < 0 || rank_index >= static_cast<int>(scores.size())) {
        return -1;
    }

    std::map<int, int, std::greater<int>> groups;
    for (int score : scores) {
        groups[score] += 1;
    }
    for (int round = 0; round < rounds; ++round) {
        std::map<int, int, std::greater<int>> next;
        for (const auto& [score, count] : groups) {
            const int winners = (count + 1) / 2;
            next[score + tournament::kWinPoints] += winners;
            if (count > winners) {
                next[score] += count - winners;
            }
        }
        groups = std::move(next);
    }

    int seen = 0;
    for (const auto& [score, count] : groups) {
        seen += count;
        if (seen > rank_index) {
            return score;
        }
    }
    return -1;
}

bool SwissProjectionChecker::HasEvenScoreLevels(const std::vector<Competitor>& field,
                                                int rounds_remaining,
                                                int threshold) {
    std::map<int, int> draw_safe_by_score;
    for (const auto& competitor : field) {
        if (CanDrawOut(competitor.points, rounds_remaining, threshold)) {
            draw_safe_by_score[competitor.points] += 1;
        }
    }
    return std::all_of(draw_safe_by_score.begin(), draw_safe_by_score.end(), [](const auto& entry) {
        return entry.second % 2 == 0;
    });
}

bool SwissProjectionChecker::IsSafe(const Competitor& first,
                                    const Competitor& second,
                                    const std::vector<Competitor>& field,
                                    int cut_size,
                                    int current_round,
                                    int total_rounds) const {
    if (cut_size < 2) {
        return false;
    }

    std::vector<int> other_scores;
    other_scores.reserve(field.size());
    for (const auto& competitor : field) {
        if (competitor.id != first.id && competitor.id != second.id) {
            other_scores.push_back(competitor.points);
        }
    }
    if (static_cast<int>(other_scores.size()) < cut_size) {
        return true;
    }
    std::sort(other_scores.begin(), other_scores.end(), std::greater<int>());

    // The pair holds two slots, so the first non-qualifier is the
    // (cut_size - 1)-th best of the others.
    const int threat_index = cut_size - 2;
    const int rounds_remaining = total_rounds - current_round;

    if (rounds_remaining <= 0) {
        const int best_threat_score = other_scores[static_cast<size_t>(threat_index)] + tournament::kWinPoints;
        return first.points + tournament::kDrawPoints > best_threat_score &&
               second.points + tournament::kDrawPoints > best_threat_score;
    }

    const int threshold = ProjectThreshold(other_scores, rounds_remaining, threat_index);
    if (threshold < 0) {
        return true;
    }
    if (!CanDrawOut(first.points, rounds_remaining, threshold) ||
        !CanDrawOut(second.points, rounds_remaining, threshold)) {
        return false;
    }
    return HasEvenScoreLevels(field, rounds_remaining, threshold);
}

}  // namespace swissim::core::rules
