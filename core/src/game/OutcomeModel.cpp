#include "swissim/core/game/OutcomeModel.h"

namespace swissim::core::game {

using tournament::Competitor;
using tournament::MatchOutcome;
using tournament::OutcomeKind;

RandomOutcomeModel::RandomOutcomeModel(std::shared_ptr<const rules::IDrawSafetyChecker> checker)
    : checker_(std::move(checker)) {
    if (!checker_) {
        checker_ = std::make_shared<rules::SwissProjectionChecker>();
    }
}

bool RandomOutcomeModel::OffersIntentionalDraw(const Competitor& first,
                                               const Competitor& second,
                                               const std::vector<Competitor>& field,
                                               const tournament::RoundContext& context) const {
    if (!context.allow_intentional_draws || context.total_rounds <= 0) {
        return false;
    }
    if (context.rounds_remaining() > kIntentionalDrawWindow) {
        return false;
    }
    return checker_->IsSafe(first,
                            second,
                            field,
                            context.cut_size,
                            context.current_round,
                            context.total_rounds);
}

MatchOutcome RandomOutcomeModel::Decide(const tournament::Pairing& pairing,
                                        const std::vector<Competitor>& field,
                                        double random_value,
                                        const tournament::RoundContext& context) const {
    MatchOutcome outcome;
    outcome.first_id = pairing.first_id;
    outcome.second_id = pairing.second_id;

    if (pairing.is_bye()) {
        outcome.kind = OutcomeKind::Bye;
        outcome.winner_id = pairing.first_id;
        return outcome;
    }

    const int second_id = *pairing.second_id;
    const Competitor* first = tournament::FindCompetitor(field, pairing.first_id);
    const Competitor* second = tournament::FindCompetitor(field, second_id);
    if (first && second && OffersIntentionalDraw(*first, *second, field, context)) {
        outcome.kind = OutcomeKind::Draw;
        outcome.intentional = true;
        return outcome;
    }

    if (random_value < context.draw_chance_percent) {
        outcome.kind = OutcomeKind::Draw;
        return outcome;
    }

    // Whatever the draw chance leaves is split evenly between the two sides.
    outcome.kind = OutcomeKind::Win;
    if (random_value < 50.0 + context.draw_chance_percent / 2.0) {
        outcome.winner_id = pairing.first_id;
        outcome.loser_id = second_id;
    } else {
        outcome.winner_id = second_id;
        outcome.loser_id = pairing.first_id;
    }
    return outcome;
}

}  // namespace swissim::core::game
