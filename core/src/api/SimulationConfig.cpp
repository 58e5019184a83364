#include "swissim/core/api/SimulationConfig.h"

#include "swissim/core/api/Analysis.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace swissim::core::api {

namespace {

bool LoadJson(const std::string& path, nlohmann::json& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    try {
        input >> config;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

nlohmann::json ToJson(const SimulationConfig& config) {
    nlohmann::json root;
    root["tournament"] = {
        {"competitors", config.tournament.competitors},
        {"rounds", config.tournament.rounds},
        {"draw_chance_percent", config.tournament.draw_chance_percent},
        {"cut_size", config.tournament.cut_size},
        {"allow_intentional_draws", config.tournament.allow_intentional_draws},
    };

    root["simulation"] = {
        {"mode", config.simulation.mode},
        {"trials", config.simulation.trials},
        {"concurrency", config.simulation.concurrency},
        {"record_round_results", config.simulation.record_round_results},
    };
    if (config.simulation.seed.has_value()) {
        root["simulation"]["seed"] = *config.simulation.seed;
    } else {
        root["simulation"]["seed"] = nullptr;
    }

    root["analysis"] = {
        {"id_cut_sizes", config.analysis.id_cut_sizes},
        {"target_probability", config.analysis.target_probability},
        {"max_rounds", config.analysis.max_rounds},
        {"standings_limit", config.analysis.standings_limit},
    };

    root["logging"] = {
        {"progress_interval", config.logging.progress_interval},
    };
    return root;
}

bool ParseRoot(const nlohmann::json& root, SimulationConfig& config, std::string* error) {
    config = SimulationConfig{};
    if (!root.is_object()) {
        if (error) {
            *error = "Config root must be a JSON object.";
        }
        return false;
    }

    try {
        if (root.contains("tournament")) {
            const auto& node = root.at("tournament");
            config.tournament.competitors = node.value("competitors", config.tournament.competitors);
            config.tournament.rounds = node.value("rounds", config.tournament.rounds);
            config.tournament.draw_chance_percent =
                node.value("draw_chance_percent", config.tournament.draw_chance_percent);
            config.tournament.cut_size = node.value("cut_size", config.tournament.cut_size);
            config.tournament.allow_intentional_draws =
                node.value("allow_intentional_draws", config.tournament.allow_intentional_draws);
        }

        if (root.contains("simulation")) {
            const auto& node = root.at("simulation");
            config.simulation.mode = node.value("mode", config.simulation.mode);
            config.simulation.trials = node.value("trials", config.simulation.trials);
            config.simulation.concurrency = node.value("concurrency", config.simulation.concurrency);
            config.simulation.record_round_results =
                node.value("record_round_results", config.simulation.record_round_results);
            if (node.contains("seed") && !node.at("seed").is_null()) {
                config.simulation.seed = node.at("seed").get<std::uint64_t>();
            }
        }

        if (root.contains("analysis")) {
            const auto& node = root.at("analysis");
            if (node.contains("id_cut_sizes")) {
                config.analysis.id_cut_sizes.clear();
                for (const auto& cut : node.at("id_cut_sizes")) {
                    config.analysis.id_cut_sizes.push_back(cut.get<int>());
                }
            }
            config.analysis.target_probability =
                node.value("target_probability", config.analysis.target_probability);
            config.analysis.max_rounds = node.value("max_rounds", config.analysis.max_rounds);
            config.analysis.standings_limit = node.value("standings_limit", config.analysis.standings_limit);
        }

        if (root.contains("logging")) {
            const auto& node = root.at("logging");
            config.logging.progress_interval = node.value("progress_interval", config.logging.progress_interval);
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }
    return true;
}

}  // namespace

SimulationConfig SimulationConfig::Clamped() const {
    SimulationConfig clamped = *this;
    clamped.tournament.competitors = std::clamp(tournament.competitors, kMinCompetitors, kMaxCompetitors);
    clamped.tournament.rounds = std::clamp(tournament.rounds, kMinRounds, kMaxRounds);
    clamped.tournament.draw_chance_percent = std::clamp(tournament.draw_chance_percent, 0.0, 100.0);
    clamped.tournament.cut_size = std::max(1, tournament.cut_size);
    clamped.simulation.trials = std::clamp(simulation.trials, kMinSimulations, kMaxSimulations);
    clamped.simulation.concurrency = std::clamp(simulation.concurrency, 1, kMaxConcurrency);
    for (auto& cut : clamped.analysis.id_cut_sizes) {
        cut = std::max(1, cut);
    }
    clamped.analysis.target_probability = std::clamp(analysis.target_probability, 0.0, 1.0);
    clamped.analysis.max_rounds = std::clamp(analysis.max_rounds, kMinRounds, kMaxRounds);
    clamped.analysis.standings_limit = std::max(0, analysis.standings_limit);
    clamped.logging.progress_interval = std::max(0, logging.progress_interval);
    return clamped;
}

bool SimulationConfig::LoadFromFile(const std::string& path, SimulationConfig& config, std::string* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }
    return ParseRoot(root, config, error);
}

bool SimulationConfig::LoadFromString(const std::string& text, SimulationConfig& config, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return ParseRoot(root, config, error);
}

bool SimulationConfig::SaveToFile(const std::string& path, const SimulationConfig& config, std::string* error) {
    const std::filesystem::path fs_path(path);
    if (!fs_path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            if (error) {
                *error = "Failed to create directory for config: " + ec.message();
            }
            return false;
        }
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        if (error) {
            *error = "Failed to write config: " + path;
        }
        return false;
    }

    output << ToJson(config).dump(2);
    return static_cast<bool>(output);
}

std::string SimulationConfig::ToJsonString(const SimulationConfig& config) {
    return ToJson(config).dump();
}

}  // namespace swissim::core::api
