#include "schedule_risk/validation.hpp"
#include "schedule_risk/errors.hpp"
#include <cmath>
#include <string>

namespace sr {

namespace {

void check_non_negative(const TaskSpec& task, const std::string& name) {
    if (!std::isfinite(task.minDuration) || !std::isfinite(task.maxDuration)) {
        throw InvalidParameter(name + " durations must be finite numbers");
    }
    if (task.minDuration < 0 || task.maxDuration < 0) {
        throw InvalidParameter(name + " durations must be positive");
    }
}

void check_ordered(const TaskSpec& task, const std::string& name) {
    if (task.minDuration > task.maxDuration) {
        throw InvalidParameter(name + " minimum duration must be less than or equal to maximum");
    }
}

// 10000 -> "10,000", as the front end prints counts.
std::string group_thousands(size_t value) {
    std::string digits = std::to_string(value);
    for (size_t pos = digits.size(); pos > 3; pos -= 3) {
        digits.insert(pos - 3, ",");
    }
    return digits;
}

} // namespace

void validateRequest(const SimulationRequest& request) {
    check_non_negative(request.taskA, "Task A");
    check_non_negative(request.taskB, "Task B");
    check_ordered(request.taskA, "Task A");
    check_ordered(request.taskB, "Task B");

    if (!std::isfinite(request.threshold) || request.threshold <= 0) {
        throw InvalidParameter("Available hours must be positive");
    }
    if (request.trialCount < MIN_TRIALS || request.trialCount > MAX_TRIALS) {
        throw InvalidParameter("Number of trials must be between " +
                               group_thousands(MIN_TRIALS) + " and " +
                               group_thousands(MAX_TRIALS));
    }
}

bool isValidRequest(const SimulationRequest& request) {
    try {
        validateRequest(request);
        return true;
    } catch (const InvalidParameter&) {
        return false;
    }
}

} // namespace sr
