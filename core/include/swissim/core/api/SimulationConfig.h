#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace swissim::core::api {

struct TournamentConfig {
    int competitors = 32;
    int rounds = 5;
    double draw_chance_percent = 2.0;
    int cut_size = 8;
    bool allow_intentional_draws = false;
};

struct SimulationSection {
    std::string mode = "lockstep";
    int trials = 1000;
    std::optional<std::uint64_t> seed;
    int concurrency = 1;
    bool record_round_results = false;
};

struct AnalysisConfig {
    std::vector<int> id_cut_sizes{4, 8};
    double target_probability = 0.9;
    int max_rounds = 25;
    int standings_limit = 8;
};

struct LoggingConfig {
    int progress_interval = 0;
};

struct SimulationConfig {
    TournamentConfig tournament;
    SimulationSection simulation;
    AnalysisConfig analysis;
    LoggingConfig logging;

    SimulationConfig Clamped() const;

    static bool LoadFromFile(const std::string& path, SimulationConfig& config, std::string* error);
    static bool LoadFromString(const std::string& text, SimulationConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const SimulationConfig& config, std::string* error);
    static std::string ToJsonString(const SimulationConfig& config);
};

}  // namespace swissim::core::api
