#ifndef SCHEDULE_RISK_HISTOGRAM_HPP
#define SCHEDULE_RISK_HISTOGRAM_HPP

#include "schedule_risk/simulation_result.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace sr {

struct BinSummary {
    double start = 0.0;
    double end = 0.0;
    std::string range;        // "start - end", one decimal each
    size_t count = 0;
    double percentage = 0.0;  // count / number of samples * 100
    // True only when the whole bin lies within the threshold. A bin that
    // straddles the threshold counts as failing even if most samples succeed.
    bool isSuccess = false;
};

constexpr size_t DEFAULT_NUM_BINS = 10;
constexpr size_t MAX_NUM_BINS = 1000;

// Equal-width bins over [min(durations), max(durations)]. When every sample
// is identical the bin width is zero and all samples land in bin 0.
// Percentages are relative to durations.size(). Throws InvalidParameter for
// empty or non-finite durations and for numBins outside [1, MAX_NUM_BINS].
std::vector<BinSummary> bin(const std::vector<double>& durations,
                            double threshold,
                            size_t numBins = DEFAULT_NUM_BINS);

std::vector<BinSummary> bin(const SimulationResult& result,
                            size_t numBins = DEFAULT_NUM_BINS);

} // namespace sr

#endif // SCHEDULE_RISK_HISTOGRAM_HPP
