#include "schedule_risk/engine.hpp"
#include "schedule_risk/distributions.hpp"
#include "schedule_risk/errors.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sr {

namespace {

std::string label(const TaskSpec& task, const char* fallback) {
    return task.name.empty() ? std::string(fallback) : task.name;
}

void check_task(const TaskSpec& task, const char* fallback) {
    const std::string name = label(task, fallback);
    if (!std::isfinite(task.minDuration) || !std::isfinite(task.maxDuration)) {
        throw InvalidParameter(name + " durations must be finite");
    }
    if (task.minDuration < 0 || task.maxDuration < 0) {
        throw InvalidParameter(name + " durations must be non-negative");
    }
    if (task.minDuration > task.maxDuration) {
        throw InvalidParameter(name + " minimum duration must be less than or equal to maximum");
    }
}

} // namespace

SimulationEngine::SimulationEngine()
    : SimulationEngine(Parameters{}) {}

SimulationEngine::SimulationEngine(const Parameters& params)
    : params_(params) {
    if (params_.max_trials == 0) {
        throw InvalidParameter("Maximum trial count must be positive");
    }
    if (params_.cancel_check_interval == 0) {
        throw InvalidParameter("Cancel check interval must be positive");
    }
}

SimulationResult SimulationEngine::run(const TaskSpec& taskA,
                                       const TaskSpec& taskB,
                                       double threshold,
                                       size_t trialCount,
                                       RandomGenerator& generator) const {
    validate_parameters(taskA, taskB, threshold, trialCount);

    const UniformDistribution<> durationA(taskA.minDuration, taskA.maxDuration);
    const UniformDistribution<> durationB(taskB.minDuration, taskB.maxDuration);

    std::vector<double> durations;
    durations.reserve(trialCount);
    size_t successCount = 0;

    for (size_t trial = 0; trial < trialCount; ++trial) {
        if (trial % params_.cancel_check_interval == 0 && cancelled()) {
            throw SimulationCancelled();
        }

        // A before B keeps the stream order fixed for a given seed.
        const double a = durationA.sample(generator);
        const double b = durationB.sample(generator);
        const double total = a + b;

        durations.push_back(total);
        if (total <= threshold) {
            ++successCount;
        }
    }

    return SimulationResult(std::move(durations), successCount, threshold);
}

SimulationResult SimulationEngine::run(const TaskSpec& taskA,
                                       const TaskSpec& taskB,
                                       double threshold,
                                       size_t trialCount) const {
    // Validate first so a bad request never touches std::random_device.
    validate_parameters(taskA, taskB, threshold, trialCount);
    MersenneTwisterGenerator generator;
    return run(taskA, taskB, threshold, trialCount, generator);
}

SimulationResult SimulationEngine::run(const SimulationRequest& request,
                                       RandomGenerator& generator) const {
    return run(request.taskA, request.taskB, request.threshold,
               request.trialCount, generator);
}

void SimulationEngine::validate_parameters(const TaskSpec& taskA,
                                           const TaskSpec& taskB,
                                           double threshold,
                                           size_t trialCount) const {
    check_task(taskA, "Task A");
    check_task(taskB, "Task B");
    if (!std::isfinite(taskA.maxDuration + taskB.maxDuration)) {
        throw InvalidParameter("Combined task durations must be finite");
    }
    if (!std::isfinite(threshold) || threshold <= 0) {
        throw InvalidParameter("Threshold must be positive");
    }
    if (trialCount == 0) {
        throw InvalidParameter("Number of trials must be positive");
    }
    if (trialCount > params_.max_trials) {
        throw InvalidParameter("Number of trials must not exceed " +
                               std::to_string(params_.max_trials));
    }
}

bool SimulationEngine::cancelled() const {
    return params_.cancel_flag != nullptr &&
           params_.cancel_flag->load(std::memory_order_relaxed);
}

} // namespace sr
