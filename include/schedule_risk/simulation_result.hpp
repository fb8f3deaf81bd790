#ifndef SCHEDULE_RISK_SIMULATION_RESULT_HPP
#define SCHEDULE_RISK_SIMULATION_RESULT_HPP

#include "schedule_risk/errors.hpp"
#include "schedule_risk/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace sr {

// Outcome of one engine run. Built once by the engine and read-only afterwards.
class SimulationResult {
public:
    // Throws InvalidParameter for an empty run or more successes than trials.
    SimulationResult(std::vector<double> durations, size_t successCount, double threshold)
        : durations_(std::move(durations))
        , successCount_(successCount)
        , totalTrials_(durations_.size())
        , probability_(0.0)
        , threshold_(threshold) {
        if (totalTrials_ == 0) {
            throw InvalidParameter("A result needs at least one trial");
        }
        if (successCount_ > totalTrials_) {
            throw InvalidParameter("Success count cannot exceed the number of trials");
        }
        probability_ = static_cast<double>(successCount_) / totalTrials_;
    }

    const std::vector<double>& durations() const { return durations_; }
    size_t successCount() const { return successCount_; }
    size_t totalTrials() const { return totalTrials_; }
    double probability() const { return probability_; }
    double threshold() const { return threshold_; }

    // Binomial standard error of the probability estimate.
    double standardError() const {
        return std::sqrt(probability_ * (1.0 - probability_) / totalTrials_);
    }

    double confidenceInterval95Low() const {
        return std::max(0.0, probability_ - 1.96 * standardError());
    }
    double confidenceInterval95High() const {
        return std::min(1.0, probability_ + 1.96 * standardError());
    }

    StatisticalAnalysis<double>::Statistics durationStats(
            const std::vector<double>& quantile_probs = {0.25, 0.5, 0.75}) const {
        return StatisticalAnalysis<double>::analyze(durations_, quantile_probs);
    }

private:
    std::vector<double> durations_;
    size_t successCount_;
    size_t totalTrials_;
    double probability_;
    double threshold_;
};

} // namespace sr

#endif // SCHEDULE_RISK_SIMULATION_RESULT_HPP
