#ifndef SCHEDULE_RISK_TASK_HPP
#define SCHEDULE_RISK_TASK_HPP

#include <cstddef>
#include <string>

namespace sr {

// Trial-count bounds accepted at the input boundary. The engine itself takes
// any count in [1, MAX_TRIALS].
constexpr size_t MIN_TRIALS = 100;
constexpr size_t MAX_TRIALS = 10000;

// One task with a duration uniformly distributed over [minDuration, maxDuration] hours.
struct TaskSpec {
    std::string name;
    double minDuration = 0.0;
    double maxDuration = 0.0;
};

struct SimulationRequest {
    TaskSpec taskA{"Task A", 2.0, 4.0};
    TaskSpec taskB{"Task B", 3.0, 6.0};
    double threshold = 8.0;      // hours available before the event
    size_t trialCount = 1000;
};

} // namespace sr

#endif // SCHEDULE_RISK_TASK_HPP
