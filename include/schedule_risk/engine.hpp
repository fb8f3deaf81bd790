#ifndef SCHEDULE_RISK_ENGINE_HPP
#define SCHEDULE_RISK_ENGINE_HPP

#include "schedule_risk/random.hpp"
#include "schedule_risk/simulation_result.hpp"
#include "schedule_risk/task.hpp"
#include <atomic>
#include <cstddef>

namespace sr {

// Monte Carlo estimator of P(A + B <= threshold) for two independent tasks
// with uniformly distributed durations.
//
// The engine keeps no state between runs; everything a run needs is passed
// in, and the only side effect is consuming the generator's stream. All
// arguments are checked before the first draw, and a failed check throws
// InvalidParameter without producing a result.
class SimulationEngine {
public:
    struct Parameters {
        size_t max_trials = MAX_TRIALS;
        // Polled between trials. When it reads true the run throws
        // SimulationCancelled and no result is produced.
        const std::atomic<bool>* cancel_flag = nullptr;
        size_t cancel_check_interval = 64;
    };

    SimulationEngine();
    explicit SimulationEngine(const Parameters& params);

    SimulationResult run(const TaskSpec& taskA,
                         const TaskSpec& taskB,
                         double threshold,
                         size_t trialCount,
                         RandomGenerator& generator) const;

    // Draws from a freshly seeded Mersenne Twister.
    SimulationResult run(const TaskSpec& taskA,
                         const TaskSpec& taskB,
                         double threshold,
                         size_t trialCount) const;

    SimulationResult run(const SimulationRequest& request,
                         RandomGenerator& generator) const;

    const Parameters& parameters() const { return params_; }

private:
    Parameters params_;

    void validate_parameters(const TaskSpec& taskA,
                             const TaskSpec& taskB,
                             double threshold,
                             size_t trialCount) const;
    bool cancelled() const;
};

} // namespace sr

#endif // SCHEDULE_RISK_ENGINE_HPP
