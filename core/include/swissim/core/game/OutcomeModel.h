#pragma once

#include "swissim/core/rules/DrawSafetyChecker.h"
#include "swissim/core/tournament/TournamentTypes.h"

#include <memory>
#include <vector>

namespace swissim::core::game {

class IOutcomeModel {
public:
    virtual ~IOutcomeModel() = default;
    virtual tournament::MatchOutcome Decide(const tournament::Pairing& pairing,
                                            const std::vector<tournament::Competitor>& field,
                                            double random_value,
                                            const tournament::RoundContext& context) const = 0;
};

class RandomOutcomeModel final : public IOutcomeModel {
public:
    // Intentional draws are only offered in the final two rounds.
    static constexpr int kIntentionalDrawWindow = 1;

    explicit RandomOutcomeModel(std::shared_ptr<const rules::IDrawSafetyChecker> checker = {});

    tournament::MatchOutcome Decide(const tournament::Pairing& pairing,
                                    const std::vector<tournament::Competitor>& field,
                                    double random_value,
                                    const tournament::RoundContext& context) const override;

private:
    bool OffersIntentionalDraw(const tournament::Competitor& first,
                               const tournament::Competitor& second,
                               const std::vector<tournament::Competitor>& field,
                               const tournament::RoundContext& context) const;

    std::shared_ptr<const rules::IDrawSafetyChecker> checker_;
};

}  // namespace swissim::core::game
