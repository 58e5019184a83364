#include "swissim/core/stats/StandingsTable.h"

namespace swissim::core::stats {

using tournament::Competitor;
using tournament::MatchOutcome;
using tournament::OutcomeKind;

StandingsTable::StandingsTable(int competitor_count)
    : competitors_(tournament::MakeField(competitor_count)) {}

const Competitor* StandingsTable::Find(int id) const {
    return tournament::FindCompetitor(competitors_, id);
}

Competitor* StandingsTable::FindMutable(int id) {
    return const_cast<Competitor*>(static_cast<const StandingsTable*>(this)->Find(id));
}

bool StandingsTable::RecordOutcome(const MatchOutcome& outcome) {
    if (outcome.kind == OutcomeKind::Bye) {
        auto* recipient = FindMutable(outcome.first_id);
        if (!recipient) {
            return false;
        }
        recipient->wins += 1;
        recipient->points += tournament::kWinPoints;
        return true;
    }

    if (!outcome.second_id.has_value()) {
        return false;
    }

    if (outcome.kind == OutcomeKind::Draw) {
        auto* first = FindMutable(outcome.first_id);
        auto* second = FindMutable(*outcome.second_id);
        if (!first || !second || first == second) {
            return false;
        }
        first->draws += 1;
        second->draws += 1;
        first->points += tournament::kDrawPoints;
        second->points += tournament::kDrawPoints;
        first->opponents.push_back(second->id);
        second->opponents.push_back(first->id);
        matches_played_ += 1;
        return true;
    }

    auto* winner = FindMutable(outcome.winner_id);
    auto* loser = FindMutable(outcome.loser_id);
    if (!winner || !loser || winner == loser) {
        return false;
    }
    winner->wins += 1;
    winner->points += tournament::kWinPoints;
    loser->losses += 1;
    winner->opponents.push_back(loser->id);
    loser->opponents.push_back(winner->id);
    matches_played_ += 1;
    return true;
}

}  // namespace swissim::core::stats
