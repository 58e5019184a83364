#include "swissim/core/runtime/TournamentEngine.h"

#include "swissim/core/tournament/SwissPairing.h"

#include <algorithm>

namespace swissim::core::runtime {

using tournament::Competitor;
using tournament::MatchOutcome;

TournamentEngine::TournamentEngine(TournamentSettings settings,
                                   std::uint64_t seed,
                                   Collaborators collaborators)
    : settings_(settings),
      standings_(settings.competitor_count),
      owned_source_(std::make_unique<game::SeededRandomSource>(seed)) {
    owned_draws_ = std::make_unique<game::DrawCache>(*owned_source_);
    draws_ = owned_draws_.get();
    ResolveCollaborators(std::move(collaborators));
}

TournamentEngine::TournamentEngine(TournamentSettings settings,
                                   game::DrawCache& shared_draws,
                                   Collaborators collaborators)
    : settings_(settings),
      standings_(settings.competitor_count),
      draws_(&shared_draws) {
    ResolveCollaborators(std::move(collaborators));
}

void TournamentEngine::ResolveCollaborators(Collaborators collaborators) {
    pairing_ = std::move(collaborators.pairing);
    ranking_ = std::move(collaborators.ranking);
    outcome_model_ = std::move(collaborators.outcome_model);
    if (!pairing_) {
        pairing_ = std::make_shared<tournament::SwissPairing>();
    }
    if (!ranking_) {
        ranking_ = std::make_shared<stats::TiebreakRanking>();
    }
    if (!outcome_model_) {
        outcome_model_ = std::make_shared<game::RandomOutcomeModel>();
    }
}

std::vector<MatchOutcome> TournamentEngine::PlayRound() {
    if (finished()) {
        return {};
    }
    current_round_ += 1;

    tournament::RoundContext context;
    context.current_round = current_round_;
    context.total_rounds = settings_.round_count;
    context.cut_size = settings_.cut_size;
    context.allow_intentional_draws = settings_.allow_intentional_draws;
    context.draw_chance_percent = settings_.draw_chance_percent;

    const auto pairings = pairing_->PairRound(standings_.competitors());

    std::vector<MatchOutcome> results;
    results.reserve(pairings.size());
    for (const auto& pairing : pairings) {
        const double random_value =
            pairing.is_bye() ? 0.0 : draws_->DrawFor(pairing.first_id, *pairing.second_id);
        // Later pairings see the results already applied this round.
        auto outcome = outcome_model_->Decide(pairing, standings_.competitors(), random_value, context);
        if (!standings_.RecordOutcome(outcome)) {
            continue;
        }
        results.push_back(std::move(outcome));
    }

    RoundSnapshot snapshot;
    snapshot.round_index = current_round_;
    snapshot.tied_for_first = stats::CountTiedForFirst(Standings());
    snapshot.intentional_draws = static_cast<int>(
        std::count_if(results.begin(), results.end(), [](const MatchOutcome& outcome) {
            return outcome.is_intentional_draw();
        }));
    snapshots_.push_back(snapshot);

    if (settings_.record_round_results) {
        round_results_.push_back(results);
    }
    return results;
}

std::vector<Competitor> TournamentEngine::PlayAllRounds() {
    while (!finished()) {
        PlayRound();
    }
    return Standings();
}

std::vector<Competitor> TournamentEngine::Standings() {
    return ranking_->Rank(standings_.mutable_competitors());
}

}  // namespace swissim::core::runtime
