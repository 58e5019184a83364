#include "swissim/core/stats/Aggregates.h"

#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace swissim::core::stats {

using tournament::Competitor;
using tournament::Record;

DistributionSummary Summarize(const std::vector<int>& values, int trial_count) {
    DistributionSummary summary;
    summary.samples = static_cast<int>(values.size());
    if (values.empty()) {
        return summary;
    }

    auto sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const size_t count = sorted.size();
    const size_t mid = count / 2;
    summary.median = count % 2 == 1
                         ? static_cast<double>(sorted[mid])
                         : (static_cast<double>(sorted[mid - 1]) + static_cast<double>(sorted[mid])) / 2.0;
    const long long total = std::accumulate(sorted.begin(), sorted.end(), 0LL);
    summary.average = static_cast<double>(total) / static_cast<double>(count);
    const auto positive = std::count_if(sorted.begin(), sorted.end(), [](int value) { return value > 0; });
    summary.frequency_percent = 100.0 * static_cast<double>(positive) / static_cast<double>(count);

    const double denominator = trial_count > 0 ? static_cast<double>(trial_count) : static_cast<double>(count);
    std::map<int, int> counts;
    for (int value : sorted) {
        counts[value] += 1;
    }
    for (const auto& [value, occurrences] : counts) {
        summary.distribution_percent[value] = 100.0 * static_cast<double>(occurrences) / denominator;
    }
    return summary;
}

int BubbleSize(const RankedStandings& ranked, int cut_size) {
    if (cut_size <= 0 || static_cast<int>(ranked.size()) < cut_size) {
        return 0;
    }
    const int cutline_points = ranked[static_cast<size_t>(cut_size - 1)].points;
    int bubble = 0;
    for (size_t i = static_cast<size_t>(cut_size); i < ranked.size(); ++i) {
        if (ranked[i].points != cutline_points) {
            break;
        }
        ++bubble;
    }
    return bubble;
}

std::vector<int> BubbleSizes(const std::vector<RankedStandings>& tournaments, int cut_size) {
    std::vector<int> sizes;
    sizes.reserve(tournaments.size());
    for (const auto& ranked : tournaments) {
        sizes.push_back(BubbleSize(ranked, cut_size));
    }
    return sizes;
}

int CutDiscrepancy(const RankedStandings& baseline, const RankedStandings& variant, int cut_size) {
    if (cut_size <= 0) {
        return 0;
    }
    const size_t limit = static_cast<size_t>(cut_size);
    std::unordered_set<int> variant_top;
    for (size_t i = 0; i < std::min(limit, variant.size()); ++i) {
        variant_top.insert(variant[i].id);
    }
    int displaced = 0;
    for (size_t i = 0; i < std::min(limit, baseline.size()); ++i) {
        if (variant_top.count(baseline[i].id) == 0) {
            ++displaced;
        }
    }
    return displaced;
}

std::vector<Record> TargetRecords(int round_count) {
    const std::vector<Record> candidates = {
        {round_count, 0, 0},
        {round_count - 1, 0, 1},
        {round_count - 1, 1, 0},
        {round_count - 2, 1, 1},
        {round_count - 2, 2, 0},
    };
    std::vector<Record> targets;
    for (const auto& record : candidates) {
        if (record.wins >= 0) {
            targets.push_back(record);
        }
    }
    return targets;
}

std::optional<Record> NormalizeTargetRecord(const Record& record) {
    const bool target_shape = (record.losses == 0 && record.draws <= 1) ||
                              (record.losses == 1 && record.draws <= 1) ||
                              (record.losses == 2 && record.draws == 0);
    if (!target_shape) {
        return std::nullopt;
    }
    return record;
}

int CompareRecords(const Record& a, const Record& b) {
    if (a.Points() != b.Points()) {
        return b.Points() - a.Points();
    }
    if (a.losses != b.losses) {
        return a.losses - b.losses;
    }
    return a.draws - b.draws;
}

std::map<std::string, std::map<int, double>> RecordAndBetterDistributions(
    const std::vector<RankedStandings>& tournaments,
    int round_count) {
    std::map<std::string, std::map<int, double>> result;
    if (tournaments.empty()) {
        return result;
    }
    const double trial_count = static_cast<double>(tournaments.size());

    for (const auto& target : TargetRecords(round_count)) {
        std::map<int, int> counts;
        for (const auto& ranked : tournaments) {
            int at_least = 0;
            for (const Competitor& competitor : ranked) {
                const auto normalized = NormalizeTargetRecord(competitor.record());
                if (normalized && CompareRecords(*normalized, target) <= 0) {
                    ++at_least;
                }
            }
            if (at_least > 0) {
                counts[at_least] += 1;
            }
        }
        if (counts.empty()) {
            continue;
        }
        auto& distribution = result[target.Label()];
        for (const auto& [count, occurrences] : counts) {
            distribution[count] = 100.0 * static_cast<double>(occurrences) / trial_count;
        }
    }
    return result;
}

}  // namespace swissim::core::stats
