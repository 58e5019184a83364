#include "swissim/core/api/Analysis.h"
#include "swissim/core/api/SimulationConfig.h"
#include "swissim/core/export/ReportJson.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace {

using swissim::core::api::SimulationConfig;

constexpr const char* kUsage =
    "Usage: swissimcli [--mode lockstep|ids|leader|standard|single] [--write-config <path>] <config.json>";

// stdout carries only the JSON report.
void LogLine(const std::string& line) {
    std::cerr << "[swissimcli] " << line << '\n';
}

swissim::core::api::SimulationParams ParamsFrom(const SimulationConfig& config) {
    swissim::core::api::SimulationParams params;
    params.competitors = config.tournament.competitors;
    params.rounds = config.tournament.rounds;
    params.draw_chance_percent = config.tournament.draw_chance_percent;
    params.simulations = config.simulation.trials;
    params.allow_intentional_draws = config.tournament.allow_intentional_draws;
    params.cut_size = config.tournament.cut_size;
    params.seed = config.simulation.seed;
    params.concurrency = config.simulation.concurrency;
    params.progress_interval = config.logging.progress_interval;
    return params;
}

bool RunMode(const std::string& mode, const SimulationConfig& config, nlohmann::json& report) {
    const swissim::core::runtime::SimulationHarness::LogFn log_fn = LogLine;

    if (mode == "lockstep") {
        swissim::core::api::LockstepParams params;
        params.competitors = config.tournament.competitors;
        params.rounds = config.tournament.rounds;
        params.draw_chance_percent = config.tournament.draw_chance_percent;
        params.simulations = config.simulation.trials;
        params.id_cut_sizes = config.analysis.id_cut_sizes;
        params.seed = config.simulation.seed;
        params.concurrency = config.simulation.concurrency;
        params.progress_interval = config.logging.progress_interval;

        swissim::core::api::LockstepReport lockstep;
        std::string error;
        if (!swissim::core::api::RunLockstepComparison(params, lockstep, &error, log_fn)) {
            std::cerr << "[swissimcli] " << error << '\n';
            return false;
        }
        report = swissim::core::exporter::LockstepReportJson(lockstep);
        return true;
    }

    if (mode == "ids") {
        const auto distribution =
            swissim::core::api::AnalyzeIntentionalDrawsPerRound(ParamsFrom(config), log_fn);
        report["intentional_draws_per_round"] =
            swissim::core::exporter::IntentionalDrawDistributionJson(distribution);
        return true;
    }

    if (mode == "leader") {
        const auto result = swissim::core::api::RoundsForSingleLeader(config.tournament.competitors,
                                                                      config.tournament.draw_chance_percent,
                                                                      config.analysis.target_probability,
                                                                      config.simulation.trials,
                                                                      config.analysis.max_rounds,
                                                                      config.simulation.seed,
                                                                      config.simulation.concurrency);
        report = swissim::core::exporter::LeaderSearchJson(result);
        return true;
    }

    if (mode == "standard") {
        const auto params = ParamsFrom(config);
        const auto tournaments = swissim::core::api::RunSimulations(params, log_fn);
        report = swissim::core::exporter::SimulationRunJson(
            params, tournaments, static_cast<size_t>(config.analysis.standings_limit));
        return true;
    }

    if (mode == "single") {
        auto engine = swissim::core::api::CreateTrial(config.tournament.competitors,
                                                      config.tournament.rounds,
                                                      config.tournament.draw_chance_percent,
                                                      config.tournament.allow_intentional_draws,
                                                      config.tournament.cut_size,
                                                      config.simulation.seed,
                                                      config.simulation.record_round_results);
        const auto standings = engine->PlayAllRounds();
        report["standings"] = swissim::core::exporter::StandingsJson(
            standings, static_cast<size_t>(config.analysis.standings_limit));
        report["rounds"] = nlohmann::json::array();
        const auto& round_results = engine->round_results();
        for (size_t i = 0; i < engine->snapshots().size(); ++i) {
            const auto& snapshot = engine->snapshots()[i];
            nlohmann::json round = {
                {"round", snapshot.round_index},
                {"tied_for_first", snapshot.tied_for_first},
                {"intentional_draws", snapshot.intentional_draws},
            };
            if (i < round_results.size()) {
                round["results"] = swissim::core::exporter::RoundResultsJson(round_results[i]);
            }
            report["rounds"].push_back(round);
        }
        return true;
    }

    std::cerr << "[swissimcli] Unknown mode: " << mode << '\n';
    return false;
}

}  // namespace

int main(int argc, char** argv) {
    std::string mode;
    std::string config_path;
    std::string write_config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            mode = argv[++i];
        } else if (arg == "--write-config" && i + 1 < argc) {
            write_config_path = argv[++i];
        } else if (config_path.empty()) {
            config_path = arg;
        } else {
            std::cerr << kUsage << '\n';
            return 1;
        }
    }

    if (config_path.empty()) {
        std::cerr << kUsage << '\n';
        return 1;
    }

    LogLine("Simulation config: " + config_path);

    SimulationConfig raw_config;
    std::string config_error;
    if (!SimulationConfig::LoadFromFile(config_path, raw_config, &config_error)) {
        std::cerr << "[swissimcli] " << config_error << '\n';
        return 1;
    }
    const SimulationConfig config = raw_config.Clamped();
    if (mode.empty()) {
        mode = config.simulation.mode;
    }

    if (!write_config_path.empty()) {
        if (!SimulationConfig::SaveToFile(write_config_path, config, &config_error)) {
            std::cerr << "[swissimcli] " << config_error << '\n';
            return 1;
        }
        LogLine("Effective config written to " + write_config_path);
    }

    nlohmann::json report;
    if (!RunMode(mode, config, report)) {
        return 1;
    }
    std::cout << report.dump(2) << '\n';
    return 0;
}
