#ifndef SCHEDULE_RISK_ANALYTIC_HPP
#define SCHEDULE_RISK_ANALYTIC_HPP

#include "schedule_risk/task.hpp"

namespace sr {

// Exact P(A + B <= threshold) for independent A ~ U[a.min, a.max] and
// B ~ U[b.min, b.max]: the CDF of their sum, a trapezoid in general, a
// uniform when one task is fixed, and a step when both are.
// Throws InvalidParameter for negative or unordered ranges.
double exactCompletionProbability(const TaskSpec& taskA,
                                  const TaskSpec& taskB,
                                  double threshold);

} // namespace sr

#endif // SCHEDULE_RISK_ANALYTIC_HPP
