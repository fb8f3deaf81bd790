#ifndef SCHEDULE_RISK_SCHEDULE_RISK_HPP
#define SCHEDULE_RISK_SCHEDULE_RISK_HPP

#include "schedule_risk/analytic.hpp"
#include "schedule_risk/distributions.hpp"
#include "schedule_risk/engine.hpp"
#include "schedule_risk/errors.hpp"
#include "schedule_risk/histogram.hpp"
#include "schedule_risk/interpretation.hpp"
#include "schedule_risk/random.hpp"
#include "schedule_risk/simulation_result.hpp"
#include "schedule_risk/statistics.hpp"
#include "schedule_risk/task.hpp"
#include "schedule_risk/validation.hpp"

#endif // SCHEDULE_RISK_SCHEDULE_RISK_HPP
