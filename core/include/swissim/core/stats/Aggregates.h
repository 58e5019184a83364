#pragma once

#include "swissim/core/tournament/TournamentTypes.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace swissim::core::stats {

using RankedStandings = std::vector<tournament::Competitor>;

struct DistributionSummary {
    int samples = 0;
    double average = 0.0;
    double median = 0.0;
    // Share of samples above zero, in percent.
    double frequency_percent = 0.0;
    // Value -> percent of trials.
    std::map<int, double> distribution_percent;
};

DistributionSummary Summarize(const std::vector<int>& values, int trial_count);

// Competitors below the cut line tied on points with the last qualifier.
int BubbleSize(const RankedStandings& ranked, int cut_size);
std::vector<int> BubbleSizes(const std::vector<RankedStandings>& tournaments, int cut_size);

// Baseline top-|cut_size| ids missing from the variant's top |cut_size|.
int CutDiscrepancy(const RankedStandings& baseline, const RankedStandings& variant, int cut_size);

std::vector<tournament::Record> TargetRecords(int round_count);
std::optional<tournament::Record> NormalizeTargetRecord(const tournament::Record& record);
// Negative when |a| is the better record: points desc, losses asc, draws asc.
int CompareRecords(const tournament::Record& a, const tournament::Record& b);

// Per target label: count of "target or better" competitors -> percent of trials.
// Counts of zero are left out; targets nobody ever reached are omitted.
std::map<std::string, std::map<int, double>> RecordAndBetterDistributions(
    const std::vector<RankedStandings>& tournaments,
    int round_count);

}  // namespace swissim::core::stats
