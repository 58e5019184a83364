#pragma once

#include "swissim/core/game/OutcomeModel.h"
#include "swissim/core/game/RandomSource.h"
#include "swissim/core/stats/RankingEngine.h"
#include "swissim/core/stats/StandingsTable.h"
#include "swissim/core/tournament/PairingEngine.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace swissim::core::runtime {

struct TournamentSettings {
    int competitor_count = 32;
    int round_count = 5;
    double draw_chance_percent = 2.0;
    bool allow_intentional_draws = false;
    int cut_size = 8;
    bool record_round_results = false;
};

struct RoundSnapshot {
    int round_index = 0;
    int tied_for_first = 0;
    int intentional_draws = 0;
};

// Unset members fall back to SwissPairing, TiebreakRanking and RandomOutcomeModel.
struct Collaborators {
    std::shared_ptr<const tournament::IPairingEngine> pairing;
    std::shared_ptr<const stats::IRankingEngine> ranking;
    std::shared_ptr<const game::IOutcomeModel> outcome_model;
};

class TournamentEngine {
public:
    TournamentEngine(TournamentSettings settings,
                     std::uint64_t seed,
                     Collaborators collaborators = {});
    // Lockstep sibling: draws come from |shared_draws|, which the caller owns.
    TournamentEngine(TournamentSettings settings,
                     game::DrawCache& shared_draws,
                     Collaborators collaborators = {});

    TournamentEngine(const TournamentEngine&) = delete;
    TournamentEngine& operator=(const TournamentEngine&) = delete;

    // Plays the next round. Returns no outcomes once the tournament is complete.
    std::vector<tournament::MatchOutcome> PlayRound();
    std::vector<tournament::Competitor> PlayAllRounds();
    std::vector<tournament::Competitor> Standings();

    int current_round() const { return current_round_; }
    bool finished() const { return current_round_ >= settings_.round_count; }
    const TournamentSettings& settings() const { return settings_; }
    const std::vector<tournament::Competitor>& competitors() const { return standings_.competitors(); }
    const std::vector<RoundSnapshot>& snapshots() const { return snapshots_; }
    const std::vector<std::vector<tournament::MatchOutcome>>& round_results() const { return round_results_; }

private:
    void ResolveCollaborators(Collaborators collaborators);

    TournamentSettings settings_;
    stats::StandingsTable standings_;
    std::unique_ptr<game::SeededRandomSource> owned_source_;
    std::unique_ptr<game::DrawCache> owned_draws_;
    game::DrawCache* draws_ = nullptr;
    std::shared_ptr<const tournament::IPairingEngine> pairing_;
    std::shared_ptr<const stats::IRankingEngine> ranking_;
    std::shared_ptr<const game::IOutcomeModel> outcome_model_;
    int current_round_ = 0;
    std::vector<RoundSnapshot> snapshots_;
    std::vector<std::vector<tournament::MatchOutcome>> round_results_;
};

}  // namespace swissim::core::runtime
