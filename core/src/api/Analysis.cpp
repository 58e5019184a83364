#include "swissim/core/api/Analysis.h"

#include "swissim/core/stats/RankingEngine.h"

#include <algorithm>

namespace swissim::core::api {

namespace {

runtime::HarnessOptions MakeHarnessOptions(const SimulationParams& params) {
    runtime::HarnessOptions options;
    options.competitor_count = params.competitors;
    options.round_count = params.rounds;
    options.draw_chance_percent = params.draw_chance_percent;
    options.trial_count = params.simulations;
    options.seed = params.seed;
    options.concurrency = params.concurrency;
    options.progress_interval = params.progress_interval;
    return options;
}

bool RunHarness(runtime::SimulationHarness& harness, const runtime::SimulationHarness::LogFn& log_fn) {
    std::string error;
    if (!harness.Run(&error)) {
        if (log_fn) {
            log_fn(error);
        }
        return false;
    }
    return true;
}

runtime::HarnessOptions SingleVariantOptions(const SimulationParams& clamped) {
    auto options = MakeHarnessOptions(clamped);
    runtime::VariantSpec variant;
    variant.label = clamped.allow_intentional_draws ? "id_top" + std::to_string(clamped.cut_size) : "standard";
    variant.allow_intentional_draws = clamped.allow_intentional_draws;
    variant.cut_size = clamped.cut_size;
    options.variants.push_back(variant);
    return options;
}

VariantReport BuildVariantReport(const runtime::VariantSpec& spec,
                                 const std::vector<stats::RankedStandings>& standings,
                                 const std::vector<int>& cut_sizes,
                                 int round_count,
                                 int trial_count) {
    VariantReport report;
    report.label = spec.label;
    report.allow_intentional_draws = spec.allow_intentional_draws;
    report.cut_size = spec.cut_size;
    for (int cut : cut_sizes) {
        report.bubbles[cut] = stats::Summarize(stats::BubbleSizes(standings, cut), trial_count);
    }
    report.records = stats::RecordAndBetterDistributions(standings, round_count);
    return report;
}

}  // namespace

SimulationParams ClampParams(const SimulationParams& params) {
    SimulationParams clamped = params;
    clamped.competitors = std::clamp(params.competitors, kMinCompetitors, kMaxCompetitors);
    clamped.rounds = std::clamp(params.rounds, kMinRounds, kMaxRounds);
    clamped.draw_chance_percent = std::clamp(params.draw_chance_percent, 0.0, 100.0);
    clamped.simulations = std::clamp(params.simulations, kMinSimulations, kMaxSimulations);
    clamped.cut_size = std::max(1, params.cut_size);
    clamped.concurrency = std::clamp(params.concurrency, 1, kMaxConcurrency);
    clamped.progress_interval = std::max(0, params.progress_interval);
    return clamped;
}

std::unique_ptr<runtime::TournamentEngine> CreateTrial(int competitor_count,
                                                       int round_count,
                                                       double draw_chance_percent,
                                                       bool allow_intentional_draws,
                                                       int cut_size,
                                                       std::optional<std::uint64_t> seed,
                                                       bool record_round_results) {
    runtime::TournamentSettings settings;
    settings.competitor_count = std::clamp(competitor_count, kMinCompetitors, kMaxCompetitors);
    settings.round_count = std::clamp(round_count, kMinRounds, kMaxRounds);
    settings.draw_chance_percent = std::clamp(draw_chance_percent, 0.0, 100.0);
    settings.allow_intentional_draws = allow_intentional_draws;
    settings.cut_size = std::max(1, cut_size);
    settings.record_round_results = record_round_results;
    const std::uint64_t resolved_seed = seed.has_value() ? *seed : game::RandomSeed();
    return std::make_unique<runtime::TournamentEngine>(settings, resolved_seed);
}

std::vector<stats::RankedStandings> RunSimulations(const SimulationParams& params,
                                                   const runtime::SimulationHarness::LogFn& log_fn) {
    const auto clamped = ClampParams(params);
    runtime::SimulationHarness harness(SingleVariantOptions(clamped), log_fn);
    if (!RunHarness(harness, log_fn)) {
        return {};
    }
    return harness.FinalStandings(0);
}

std::map<int, std::map<int, int>> AnalyzeIntentionalDrawsPerRound(
    const SimulationParams& params,
    const runtime::SimulationHarness::LogFn& log_fn) {
    auto clamped = ClampParams(params);
    clamped.allow_intentional_draws = true;
    runtime::SimulationHarness harness(SingleVariantOptions(clamped), log_fn);
    if (!RunHarness(harness, log_fn)) {
        return {};
    }
    return harness.IntentionalDrawDistribution(0);
}

std::map<int, std::vector<int>> TiedForFirstPerRound(const SimulationParams& params,
                                                     const runtime::SimulationHarness::LogFn& log_fn) {
    const auto clamped = ClampParams(params);
    runtime::SimulationHarness harness(SingleVariantOptions(clamped), log_fn);
    if (!RunHarness(harness, log_fn)) {
        return {};
    }
    return harness.TiedForFirstPerRound(0);
}

double ProbabilitySingleLeader(int competitor_count,
                               int round_count,
                               double draw_chance_percent,
                               int simulations,
                               std::optional<std::uint64_t> seed,
                               int concurrency) {
    SimulationParams params;
    params.competitors = competitor_count;
    params.rounds = round_count;
    params.draw_chance_percent = draw_chance_percent;
    params.simulations = simulations;
    params.allow_intentional_draws = false;
    params.seed = seed;
    params.concurrency = concurrency;

    const auto results = RunSimulations(params);
    if (results.empty()) {
        return 0.0;
    }
    const auto sole_leaders = std::count_if(results.begin(), results.end(), [](const auto& ranked) {
        return stats::CountTiedForFirst(ranked) == 1;
    });
    return static_cast<double>(sole_leaders) / static_cast<double>(results.size());
}

LeaderSearchResult RoundsForSingleLeader(int competitor_count,
                                         double draw_chance_percent,
                                         double target_probability,
                                         int simulations,
                                         int max_rounds,
                                         std::optional<std::uint64_t> seed,
                                         int concurrency) {
    const int rounds_limit = std::clamp(max_rounds, kMinRounds, kMaxRounds);
    const double target = std::clamp(target_probability, 0.0, 1.0);

    LeaderSearchResult result;
    for (int rounds = 1; rounds <= rounds_limit; ++rounds) {
        const double probability = ProbabilitySingleLeader(
            competitor_count, rounds, draw_chance_percent, simulations, seed, concurrency);
        result.by_round.emplace_back(rounds, probability);
        if (probability >= target) {
            result.rounds = rounds;
            result.probability_at_rounds = probability;
            return result;
        }
    }
    result.rounds = rounds_limit;
    result.probability_at_rounds = result.by_round.empty() ? 0.0 : result.by_round.back().second;
    return result;
}

bool RunLockstepComparison(const LockstepParams& params,
                           LockstepReport& report,
                           std::string* error,
                           const runtime::SimulationHarness::LogFn& log_fn) {
    if (params.id_cut_sizes.empty()) {
        if (error) {
            *error = "Select at least one intentional draw cut size to analyze.";
        }
        return false;
    }

    LockstepParams clamped = params;
    clamped.competitors = std::clamp(params.competitors, kMinCompetitors, kMaxCompetitors);
    clamped.rounds = std::clamp(params.rounds, kMinRounds, kMaxRounds);
    clamped.draw_chance_percent = std::clamp(params.draw_chance_percent, 0.0, 100.0);
    clamped.simulations = std::clamp(params.simulations, kMinSimulations, kMaxSimulations);
    clamped.concurrency = std::clamp(params.concurrency, 1, kMaxConcurrency);
    for (auto& cut : clamped.id_cut_sizes) {
        cut = std::max(1, cut);
    }

    runtime::HarnessOptions options;
    options.competitor_count = clamped.competitors;
    options.round_count = clamped.rounds;
    options.draw_chance_percent = clamped.draw_chance_percent;
    options.trial_count = clamped.simulations;
    options.seed = clamped.seed;
    options.concurrency = clamped.concurrency;
    options.progress_interval = std::max(0, clamped.progress_interval);

    runtime::VariantSpec baseline;
    baseline.label = "standard";
    baseline.allow_intentional_draws = false;
    baseline.cut_size = clamped.id_cut_sizes.front();
    options.variants.push_back(baseline);
    for (int cut : clamped.id_cut_sizes) {
        runtime::VariantSpec variant;
        variant.label = "id_top" + std::to_string(cut);
        variant.allow_intentional_draws = true;
        variant.cut_size = cut;
        options.variants.push_back(variant);
    }

    runtime::SimulationHarness harness(options, log_fn);
    if (!harness.Run(error)) {
        return false;
    }

    report = LockstepReport{};
    report.params = clamped;
    report.params.seed = harness.base_seed();

    const auto baseline_standings = harness.FinalStandings(0);
    report.baseline = BuildVariantReport(
        options.variants[0], baseline_standings, clamped.id_cut_sizes, clamped.rounds, clamped.simulations);

    for (size_t v = 1; v < options.variants.size(); ++v) {
        const auto& spec = options.variants[v];
        const auto standings = harness.FinalStandings(v);
        report.id_variants.push_back(BuildVariantReport(
            spec, standings, clamped.id_cut_sizes, clamped.rounds, clamped.simulations));

        std::vector<int> displaced;
        displaced.reserve(standings.size());
        for (size_t trial = 0; trial < standings.size() && trial < baseline_standings.size(); ++trial) {
            displaced.push_back(stats::CutDiscrepancy(baseline_standings[trial], standings[trial], spec.cut_size));
        }
        report.discrepancy[spec.cut_size] = stats::Summarize(displaced, clamped.simulations);
    }
    return true;
}

}  // namespace swissim::core::api
