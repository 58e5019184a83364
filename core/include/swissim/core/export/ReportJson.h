#pragma once

#include "swissim/core/api/Analysis.h"
#include "swissim/core/stats/Aggregates.h"

#include <nlohmann/json.hpp>

#include <map>
#include <vector>

namespace swissim::core::exporter {

nlohmann::json StandingsJson(const stats::RankedStandings& ranked, size_t limit);
nlohmann::json RoundResultsJson(const std::vector<tournament::MatchOutcome>& outcomes);
nlohmann::json SummaryJson(const stats::DistributionSummary& summary);
nlohmann::json LockstepReportJson(const api::LockstepReport& report);
nlohmann::json IntentionalDrawDistributionJson(const std::map<int, std::map<int, int>>& distribution);
nlohmann::json LeaderSearchJson(const api::LeaderSearchResult& result);
nlohmann::json SimulationRunJson(const api::SimulationParams& params,
                                 const std::vector<stats::RankedStandings>& tournaments,
                                 size_t standings_limit);

}  // namespace swissim::core::exporter
