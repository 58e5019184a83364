#pragma once

#include "swissim/core/runtime/SimulationHarness.h"
#include "swissim/core/runtime/TournamentEngine.h"
#include "swissim/core/stats/Aggregates.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace swissim::core::api {

constexpr int kMinCompetitors = 2;
constexpr int kMaxCompetitors = 10000;
constexpr int kMinRounds = 1;
constexpr int kMaxRounds = 50;
constexpr int kMinSimulations = 1;
constexpr int kMaxSimulations = 10000;
constexpr int kMaxConcurrency = 64;

struct SimulationParams {
    int competitors = 32;
    int rounds = 5;
    double draw_chance_percent = 2.0;
    int simulations = 1000;
    bool allow_intentional_draws = true;
    int cut_size = 8;
    std::optional<std::uint64_t> seed;
    int concurrency = 1;
    int progress_interval = 0;
};

SimulationParams ClampParams(const SimulationParams& params);

std::unique_ptr<runtime::TournamentEngine> CreateTrial(int competitor_count,
                                                       int round_count,
                                                       double draw_chance_percent,
                                                       bool allow_intentional_draws,
                                                       int cut_size,
                                                       std::optional<std::uint64_t> seed = std::nullopt,
                                                       bool record_round_results = false);

std::vector<stats::RankedStandings> RunSimulations(const SimulationParams& params,
                                                   const runtime::SimulationHarness::LogFn& log_fn = {});

// Intentional draws are always enabled here.
std::map<int, std::map<int, int>> AnalyzeIntentionalDrawsPerRound(
    const SimulationParams& params,
    const runtime::SimulationHarness::LogFn& log_fn = {});

// Round -> number of competitors tied for first after that round, one entry per trial.
std::map<int, std::vector<int>> TiedForFirstPerRound(const SimulationParams& params,
                                                     const runtime::SimulationHarness::LogFn& log_fn = {});

double ProbabilitySingleLeader(int competitor_count,
                               int round_count,
                               double draw_chance_percent,
                               int simulations,
                               std::optional<std::uint64_t> seed = std::nullopt,
                               int concurrency = 1);

struct LeaderSearchResult {
    int rounds = 0;
    double probability_at_rounds = 0.0;
    std::vector<std::pair<int, double>> by_round;
};

LeaderSearchResult RoundsForSingleLeader(int competitor_count,
                                         double draw_chance_percent,
                                         double target_probability = 0.9,
                                         int simulations = 5000,
                                         int max_rounds = 25,
                                         std::optional<std::uint64_t> seed = std::nullopt,
                                         int concurrency = 1);

struct LockstepParams {
    int competitors = 32;
    int rounds = 5;
    double draw_chance_percent = 5.0;
    int simulations = 10000;
    std::vector<int> id_cut_sizes{4, 8};
    std::optional<std::uint64_t> seed;
    int concurrency = 1;
    int progress_interval = 0;
};

struct VariantReport {
    std::string label;
    bool allow_intentional_draws = false;
    int cut_size = 0;
    // Cut size -> bubble summary.
    std::map<int, stats::DistributionSummary> bubbles;
    std::map<std::string, std::map<int, double>> records;
};

struct LockstepReport {
    LockstepParams params;
    VariantReport baseline;
    std::vector<VariantReport> id_variants;
    // ID cut size -> competitors pushed out of that cut by intentional draws.
    std::map<int, stats::DistributionSummary> discrepancy;
};

// Baseline without intentional draws plus one ID variant per cut size, all
// sharing per-pairing draws. An empty cut size list is a configuration error.
bool RunLockstepComparison(const LockstepParams& params,
                           LockstepReport& report,
                           std::string* error,
                           const runtime::SimulationHarness::LogFn& log_fn = {});

}  // namespace swissim::core::api
