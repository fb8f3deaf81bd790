#ifndef SCHEDULE_RISK_STATISTICS_HPP
#define SCHEDULE_RISK_STATISTICS_HPP

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace sr {

// Descriptive statistics over a sample of total durations.
template<typename T>
class StatisticalAnalysis {
public:
    struct Statistics {
        T mean;
        T median;
        T variance;
        T standardDeviation;
        T standardError;
        T min;
        T max;
        std::vector<T> quantiles;
        size_t sampleSize;
    };

    static Statistics analyze(const std::vector<T>& data,
                              const std::vector<double>& quantile_probs = {0.25, 0.5, 0.75}) {
        if (data.empty()) {
            throw std::invalid_argument("Empty data set");
        }
        for (double p : quantile_probs) {
            if (p < 0.0 || p > 1.0) {
                throw std::invalid_argument("Quantile probabilities must be between 0 and 1");
            }
        }

        std::vector<T> sorted_data = data;
        std::sort(sorted_data.begin(), sorted_data.end());

        Statistics stats;
        stats.sampleSize = data.size();
        stats.mean = calculate_mean(data);
        stats.median = calculate_median(sorted_data);
        stats.variance = calculate_variance(data, stats.mean);
        stats.standardDeviation = std::sqrt(stats.variance);
        stats.standardError = stats.standardDeviation / std::sqrt(static_cast<T>(data.size()));
        stats.min = sorted_data.front();
        stats.max = sorted_data.back();
        stats.quantiles = calculate_quantiles(sorted_data, quantile_probs);

        return stats;
    }

private:
    static T calculate_mean(const std::vector<T>& data) {
        return std::accumulate(data.begin(), data.end(), T(0)) / static_cast<T>(data.size());
    }

    static T calculate_median(const std::vector<T>& sorted_data) {
        if (sorted_data.size() % 2 == 0) {
            size_t mid = sorted_data.size() / 2;
            return (sorted_data[mid - 1] + sorted_data[mid]) / 2;
        }
        return sorted_data[sorted_data.size() / 2];
    }

    // Sample variance; a single observation has none.
    static T calculate_variance(const std::vector<T>& data, T mean) {
        if (data.size() < 2) return T(0);
        T sum_sq_diff = 0;
        for (const auto& x : data) {
            T diff = x - mean;
            sum_sq_diff += diff * diff;
        }
        return sum_sq_diff / (data.size() - 1);
    }

    static std::vector<T> calculate_quantiles(const std::vector<T>& sorted_data,
                                              const std::vector<double>& probs) {
        std::vector<T> quantiles;
        quantiles.reserve(probs.size());

        for (double p : probs) {
            double idx = p * (sorted_data.size() - 1);
            size_t i = static_cast<size_t>(idx);
            double frac = idx - i;

            if (i + 1 >= sorted_data.size()) {
                quantiles.push_back(sorted_data.back());
            } else {
                quantiles.push_back(sorted_data[i] * (1 - frac) +
                                    sorted_data[i + 1] * frac);
            }
        }

        return quantiles;
    }
};

} // namespace sr

#endif // SCHEDULE_RISK_STATISTICS_HPP
