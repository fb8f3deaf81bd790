#include "schedule_risk/histogram.hpp"
#include "schedule_risk/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace sr {

namespace {

std::string format_range(double start, double end) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << start << " - " << end;
    return out.str();
}

} // namespace

std::vector<BinSummary> bin(const std::vector<double>& durations,
                            double threshold,
                            size_t numBins) {
    if (durations.empty()) {
        throw InvalidParameter("Cannot bin an empty set of durations");
    }
    if (numBins == 0 || numBins > MAX_NUM_BINS) {
        throw InvalidParameter("Number of bins must be between 1 and " +
                               std::to_string(MAX_NUM_BINS));
    }
    for (double d : durations) {
        if (!std::isfinite(d)) {
            throw InvalidParameter("Durations must be finite");
        }
    }

    const auto [min_it, max_it] = std::minmax_element(durations.begin(), durations.end());
    const double minD = *min_it;
    const double maxD = *max_it;
    const double range = maxD - minD;
    if (!std::isfinite(range)) {
        throw InvalidParameter("Duration range is too wide to bin");
    }
    const double binSize = range / static_cast<double>(numBins);
    const size_t totalTrials = durations.size();

    std::vector<size_t> counts(numBins, 0);
    for (double d : durations) {
        size_t index = 0;
        if (binSize > 0) {
            const double raw = std::floor((d - minD) / binSize);
            index = std::min(static_cast<size_t>(raw), numBins - 1);
        }
        ++counts[index];
    }

    std::vector<BinSummary> bins;
    bins.reserve(numBins);
    for (size_t i = 0; i < numBins; ++i) {
        BinSummary summary;
        summary.start = minD + static_cast<double>(i) * binSize;
        summary.end = summary.start + binSize;
        summary.range = format_range(summary.start, summary.end);
        summary.count = counts[i];
        summary.percentage = static_cast<double>(counts[i]) / totalTrials * 100.0;
        summary.isSuccess = summary.end <= threshold;
        bins.push_back(summary);
    }
    return bins;
}

std::vector<BinSummary> bin(const SimulationResult& result, size_t numBins) {
    return bin(result.durations(), result.threshold(), numBins);
}

} // namespace sr
