#pragma once

#include <optional>
#include <string>
#include <vector>

namespace swissim::core::tournament {

constexpr int kWinPoints = 3;
constexpr int kDrawPoints = 1;

struct Record {
    int wins = 0;
    int losses = 0;
    int draws = 0;

    int Points() const { return wins * kWinPoints + draws * kDrawPoints; }
    std::string Label() const;
};

struct Competitor {
    int id = -1;
    int points = 0;
    int wins = 0;
    int losses = 0;
    int draws = 0;
    std::vector<int> opponents;
    // Derived; refreshed by every ranking pass.
    double opponent_win_percentage = 0.0;

    int matches_played() const { return wins + losses + draws; }
    double match_win_rate() const {
        const int played = matches_played();
        if (played == 0) {
            return 0.0;
        }
        return (static_cast<double>(wins) + 0.5 * static_cast<double>(draws)) /
               static_cast<double>(played);
    }
    Record record() const { return {wins, losses, draws}; }
    std::string RecordString() const { return record().Label(); }
};

struct Pairing {
    int first_id = -1;
    std::optional<int> second_id;

    bool is_bye() const { return !second_id.has_value(); }
};

enum class OutcomeKind {
    Win,
    Draw,
    Bye,
};

struct MatchOutcome {
    OutcomeKind kind = OutcomeKind::Win;
    bool intentional = false;
    int first_id = -1;
    std::optional<int> second_id;
    int winner_id = -1;
    int loser_id = -1;

    bool is_draw() const { return kind == OutcomeKind::Draw; }
    bool is_bye() const { return kind == OutcomeKind::Bye; }
    bool is_intentional_draw() const { return is_draw() && intentional; }
};

struct RoundContext {
    // 1-based index of the round being played.
    int current_round = 0;
    int total_rounds = 0;
    int cut_size = 8;
    bool allow_intentional_draws = false;
    double draw_chance_percent = 0.0;

    int rounds_remaining() const { return total_rounds - current_round; }
};

std::vector<Competitor> MakeField(int competitor_count);

// Checks index == id first, then falls back to a linear scan.
const Competitor* FindCompetitor(const std::vector<Competitor>& field, int id);

}  // namespace swissim::core::tournament
