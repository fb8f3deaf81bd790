#include "schedule_risk/analytic.hpp"
#include "schedule_risk/distributions.hpp"
#include "schedule_risk/errors.hpp"
#include <algorithm>
#include <cmath>

namespace sr {

double exactCompletionProbability(const TaskSpec& taskA,
                                  const TaskSpec& taskB,
                                  double threshold) {
    if (taskA.minDuration < 0 || taskB.minDuration < 0) {
        throw InvalidParameter("Task durations must be non-negative");
    }
    if (std::isnan(threshold)) {
        throw InvalidParameter("Threshold must be a number");
    }
    // Construction checks finiteness and ordering.
    const UniformDistribution<> a(taskA.minDuration, taskA.maxDuration);
    const UniformDistribution<> b(taskB.minDuration, taskB.maxDuration);

    // A fixed task shifts the other task's CDF.
    if (a.isDegenerate()) return b.cdf(threshold - a.min());
    if (b.isDegenerate()) return a.cdf(threshold - b.min());

    const double t = threshold - a.min() - b.min();
    const double w1 = std::min(a.width(), b.width());
    const double w2 = std::max(a.width(), b.width());

    if (t <= 0) return 0.0;
    if (t <= w1) return t * t / (2 * w1 * w2);
    if (t <= w2) return (t - w1 / 2) / w2;
    if (t < w1 + w2) {
        const double r = w1 + w2 - t;
        return 1.0 - r * r / (2 * w1 * w2);
    }
    return 1.0;
}

} // namespace sr
