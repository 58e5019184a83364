#include "swissim/core/export/ReportJson.h"

#include "swissim/core/stats/RankingEngine.h"

#include <algorithm>
#include <string>

namespace swissim::core::exporter {

namespace {

nlohmann::json PercentMap(const std::map<int, double>& distribution) {
    nlohmann::json node = nlohmann::json::object();
    for (const auto& [value, percent] : distribution) {
        node[std::to_string(value)] = percent;
    }
    return node;
}

nlohmann::json VariantJson(const api::VariantReport& variant) {
    nlohmann::json node;
    node["label"] = variant.label;
    node["allow_intentional_draws"] = variant.allow_intentional_draws;
    node["cut_size"] = variant.cut_size;
    node["bubbles"] = nlohmann::json::object();
    for (const auto& [cut, summary] : variant.bubbles) {
        node["bubbles"]["top" + std::to_string(cut)] = SummaryJson(summary);
    }
    node["records"] = nlohmann::json::object();
    for (const auto& [label, distribution] : variant.records) {
        node["records"][label] = {{"record_and_better_distribution", PercentMap(distribution)}};
    }
    return node;
}

}  // namespace

nlohmann::json StandingsJson(const stats::RankedStandings& ranked, size_t limit) {
    nlohmann::json rows = nlohmann::json::array();
    const size_t count = std::min(limit, ranked.size());
    for (size_t i = 0; i < count; ++i) {
        const auto& row = ranked[i];
        rows.push_back({
            {"rank", static_cast<int>(i + 1)},
            {"id", row.id},
            {"pts", row.points},
            {"record", row.RecordString()},
            {"w", row.wins},
            {"l", row.losses},
            {"d", row.draws},
            {"owp", row.opponent_win_percentage},
        });
    }
    return rows;
}

nlohmann::json RoundResultsJson(const std::vector<tournament::MatchOutcome>& outcomes) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        nlohmann::json row = {{"first", outcome.first_id}};
        if (outcome.second_id.has_value()) {
            row["second"] = *outcome.second_id;
        } else {
            row["second"] = nullptr;
        }
        if (outcome.is_bye()) {
            row["result"] = "bye";
        } else if (outcome.is_intentional_draw()) {
            row["result"] = "intentional_draw";
        } else if (outcome.is_draw()) {
            row["result"] = "draw";
        } else {
            row["result"] = "win";
            row["winner"] = outcome.winner_id;
        }
        rows.push_back(row);
    }
    return rows;
}

nlohmann::json SummaryJson(const stats::DistributionSummary& summary) {
    return {
        {"samples", summary.samples},
        {"average", summary.average},
        {"median", summary.median},
        {"frequency_percent", summary.frequency_percent},
        {"distribution_percent", PercentMap(summary.distribution_percent)},
    };
}

nlohmann::json LockstepReportJson(const api::LockstepReport& report) {
    nlohmann::json root;
    root["params"] = {
        {"competitors", report.params.competitors},
        {"rounds", report.params.rounds},
        {"draw_chance_percent", report.params.draw_chance_percent},
        {"simulations", report.params.simulations},
        {"id_cut_sizes", report.params.id_cut_sizes},
    };
    if (report.params.seed.has_value()) {
        root["params"]["seed"] = *report.params.seed;
    }
    root["baseline"] = VariantJson(report.baseline);
    root["id_variants"] = nlohmann::json::array();
    for (const auto& variant : report.id_variants) {
        root["id_variants"].push_back(VariantJson(variant));
    }
    root["discrepancy"] = nlohmann::json::object();
    for (const auto& [cut, summary] : report.discrepancy) {
        root["discrepancy"]["top" + std::to_string(cut)] = SummaryJson(summary);
    }
    return root;
}

nlohmann::json IntentionalDrawDistributionJson(const std::map<int, std::map<int, int>>& distribution) {
    nlohmann::json root = nlohmann::json::object();
    for (const auto& [round, frequencies] : distribution) {
        nlohmann::json node = nlohmann::json::object();
        for (const auto& [count, trials] : frequencies) {
            node[std::to_string(count)] = trials;
        }
        root[std::to_string(round)] = node;
    }
    return root;
}

nlohmann::json LeaderSearchJson(const api::LeaderSearchResult& result) {
    nlohmann::json by_round = nlohmann::json::array();
    for (const auto& [rounds, probability] : result.by_round) {
        by_round.push_back({{"rounds", rounds}, {"probability", probability}});
    }
    return {
        {"rounds", result.rounds},
        {"probability_at_rounds", result.probability_at_rounds},
        {"by_round", by_round},
    };
}

nlohmann::json SimulationRunJson(const api::SimulationParams& params,
                                 const std::vector<stats::RankedStandings>& tournaments,
                                 size_t standings_limit) {
    nlohmann::json root;
    root["params"] = {
        {"competitors", params.competitors},
        {"rounds", params.rounds},
        {"draw_chance_percent", params.draw_chance_percent},
        {"simulations", params.simulations},
        {"allow_intentional_draws", params.allow_intentional_draws},
        {"cut_size", params.cut_size},
    };
    root["tournaments"] = static_cast<int>(tournaments.size());

    std::vector<int> leaders;
    leaders.reserve(tournaments.size());
    for (const auto& ranked : tournaments) {
        leaders.push_back(stats::CountTiedForFirst(ranked));
    }
    root["tied_for_first"] = SummaryJson(stats::Summarize(leaders, static_cast<int>(tournaments.size())));
    root["bubble"] = SummaryJson(stats::Summarize(stats::BubbleSizes(tournaments, params.cut_size),
                                                  static_cast<int>(tournaments.size())));
    if (!tournaments.empty()) {
        root["first_standings"] = StandingsJson(tournaments.front(), standings_limit);
    }
    return root;
}

}  // namespace swissim::core::exporter
