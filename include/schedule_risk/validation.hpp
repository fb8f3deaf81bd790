#ifndef SCHEDULE_RISK_VALIDATION_HPP
#define SCHEDULE_RISK_VALIDATION_HPP

#include "schedule_risk/task.hpp"

namespace sr {

// Front-end input checks, applied before a request reaches the engine.
// Throws InvalidParameter with a user-facing message for the first problem
// found: negative durations, min > max, non-positive threshold, or a trial
// count outside [MIN_TRIALS, MAX_TRIALS].
void validateRequest(const SimulationRequest& request);

bool isValidRequest(const SimulationRequest& request);

} // namespace sr

#endif // SCHEDULE_RISK_VALIDATION_HPP
