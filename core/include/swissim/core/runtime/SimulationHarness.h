#pragma once

#include "swissim/core/runtime/TournamentEngine.h"
#include "swissim/core/stats/Aggregates.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swissim::core::runtime {

struct VariantSpec {
    std::string label;
    bool allow_intentional_draws = false;
    int cut_size = 8;
};

struct HarnessOptions {
    int competitor_count = 32;
    int round_count = 5;
    double draw_chance_percent = 2.0;
    int trial_count = 100;
    std::optional<std::uint64_t> seed;
    int concurrency = 1;
    std::vector<VariantSpec> variants;
    bool record_round_results = false;
    // Log every N completed trials; 0 disables progress lines.
    int progress_interval = 0;
};

struct VariantTrial {
    stats::RankedStandings final_standings;
    std::vector<RoundSnapshot> snapshots;
    std::vector<std::vector<tournament::MatchOutcome>> round_results;
};

struct TrialResult {
    int trial_index = 0;
    std::vector<VariantTrial> variants;
};

class SimulationHarness {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit SimulationHarness(HarnessOptions options,
                               LogFn log_fn = {},
                               Collaborators collaborators = {});

    bool Run(std::string* error);

    // Every variant of one trial shares a single draw cache, cleared at the
    // start of each round, fed by the trial's own (base_seed, trial_index) stream.
    static TrialResult RunTrial(const HarnessOptions& options,
                                std::uint64_t base_seed,
                                int trial_index,
                                const Collaborators& collaborators);

    const HarnessOptions& options() const { return options_; }
    std::uint64_t base_seed() const { return base_seed_; }
    const std::vector<TrialResult>& trials() const { return trials_; }

    std::vector<stats::RankedStandings> FinalStandings(size_t variant_index) const;
    std::map<int, std::vector<int>> TiedForFirstPerRound(size_t variant_index) const;
    std::map<int, std::vector<int>> IntentionalDrawsPerRound(size_t variant_index) const;
    // Round -> (intentional draws in that round -> number of trials).
    std::map<int, std::map<int, int>> IntentionalDrawDistribution(size_t variant_index) const;

private:
    void RunWorker(std::atomic<int>& next_trial, std::atomic<int>& completed);
    void Log(const std::string& line);

    HarnessOptions options_;
    LogFn log_fn_;
    Collaborators collaborators_;
    std::uint64_t base_seed_ = 0;
    std::vector<TrialResult> trials_;
    std::mutex log_mutex_;
};

}  // namespace swissim::core::runtime
