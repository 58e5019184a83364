#include "swissim/core/runtime/SimulationHarness.h"

#include <algorithm>
#include <memory>
#include <sstream>
#include <thread>

namespace swissim::core::runtime {

SimulationHarness::SimulationHarness(HarnessOptions options,
                                     LogFn log_fn,
                                     Collaborators collaborators)
    : options_(std::move(options)),
      log_fn_(std::move(log_fn)),
      collaborators_(std::move(collaborators)) {}

void SimulationHarness::Log(const std::string& line) {
    if (!log_fn_) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_fn_(line);
}

bool SimulationHarness::Run(std::string* error) {
    if (options_.variants.empty()) {
        if (error) {
            *error = "No simulation variants configured.";
        }
        return false;
    }
    if (options_.trial_count <= 0) {
        if (error) {
            *error = "Trial count must be positive.";
        }
        return false;
    }
    if (options_.competitor_count < 2 || options_.round_count < 1) {
        if (error) {
            *error = "A tournament needs at least two competitors and one round.";
        }
        return false;
    }

    base_seed_ = options_.seed.has_value() ? *options_.seed : game::RandomSeed();
    trials_.assign(static_cast<size_t>(options_.trial_count), {});

    const int worker_count = std::max(1, std::min(options_.concurrency, options_.trial_count));
    {
        std::ostringstream line;
        line << "Running " << options_.trial_count << " trials x " << options_.variants.size()
             << " variants (" << options_.competitor_count << " competitors, " << options_.round_count
             << " rounds, seed " << base_seed_ << ", workers " << worker_count << ")";
        Log(line.str());
    }

    std::atomic<int> next_trial{0};
    std::atomic<int> completed{0};
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(worker_count));
    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() { RunWorker(next_trial, completed); });
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Log("Completed " + std::to_string(completed.load()) + " trials.");
    return true;
}

void SimulationHarness::RunWorker(std::atomic<int>& next_trial, std::atomic<int>& completed) {
    while (true) {
        const int index = next_trial.fetch_add(1);
        if (index >= options_.trial_count) {
            return;
        }
        trials_[static_cast<size_t>(index)] = RunTrial(options_, base_seed_, index, collaborators_);
        const int done = completed.fetch_add(1) + 1;
        if (options_.progress_interval > 0 && done % options_.progress_interval == 0) {
            Log("Trials completed: " + std::to_string(done) + "/" + std::to_string(options_.trial_count));
        }
    }
}

TrialResult SimulationHarness::RunTrial(const HarnessOptions& options,
                                        std::uint64_t base_seed,
                                        int trial_index,
                                        const Collaborators& collaborators) {
    game::SeededRandomSource source(base_seed, static_cast<std::uint64_t>(trial_index));
    game::DrawCache draws(source);

    std::vector<std::unique_ptr<TournamentEngine>> engines;
    engines.reserve(options.variants.size());
    for (const auto& variant : options.variants) {
        TournamentSettings settings;
        settings.competitor_count = options.competitor_count;
        settings.round_count = options.round_count;
        settings.draw_chance_percent = options.draw_chance_percent;
        settings.allow_intentional_draws = variant.allow_intentional_draws;
        settings.cut_size = variant.cut_size;
        settings.record_round_results = options.record_round_results;
        engines.push_back(std::make_unique<TournamentEngine>(settings, draws, collaborators));
    }

    for (int round = 0; round < options.round_count; ++round) {
        draws.Clear();
        for (auto& engine : engines) {
            engine->PlayRound();
        }
    }

    TrialResult result;
    result.trial_index = trial_index;
    result.variants.reserve(engines.size());
    for (auto& engine : engines) {
        VariantTrial variant;
        variant.final_standings = engine->Standings();
        variant.snapshots = engine->snapshots();
        variant.round_results = engine->round_results();
        result.variants.push_back(std::move(variant));
    }
    return result;
}

std::vector<stats::RankedStandings> SimulationHarness::FinalStandings(size_t variant_index) const {
    std::vector<stats::RankedStandings> standings;
    standings.reserve(trials_.size());
    for (const auto& trial : trials_) {
        if (variant_index < trial.variants.size()) {
            standings.push_back(trial.variants[variant_index].final_standings);
        }
    }
    return standings;
}

std::map<int, std::vector<int>> SimulationHarness::TiedForFirstPerRound(size_t variant_index) const {
    std::map<int, std::vector<int>> per_round;
    for (int round = 1; round <= options_.round_count; ++round) {
        per_round[round];
    }
    for (const auto& trial : trials_) {
        if (variant_index >= trial.variants.size()) {
            continue;
        }
        for (const auto& snapshot : trial.variants[variant_index].snapshots) {
            per_round[snapshot.round_index].push_back(snapshot.tied_for_first);
        }
    }
    return per_round;
}

std::map<int, std::vector<int>> SimulationHarness::IntentionalDrawsPerRound(size_t variant_index) const {
    std::map<int, std::vector<int>> per_round;
    for (int round = 1; round <= options_.round_count; ++round) {
        per_round[round];
    }
    for (const auto& trial : trials_) {
        if (variant_index >= trial.variants.size()) {
            continue;
        }
        for (const auto& snapshot : trial.variants[variant_index].snapshots) {
            per_round[snapshot.round_index].push_back(snapshot.intentional_draws);
        }
    }
    return per_round;
}

std::map<int, std::map<int, int>> SimulationHarness::IntentionalDrawDistribution(size_t variant_index) const {
    std::map<int, std::map<int, int>> distribution;
    for (const auto& [round, counts] : IntentionalDrawsPerRound(variant_index)) {
        auto& frequencies = distribution[round];
        for (int count : counts) {
            frequencies[count] += 1;
        }
    }
    return distribution;
}

}  // namespace swissim::core::runtime
