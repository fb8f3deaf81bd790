#ifndef SCHEDULE_RISK_INTERPRETATION_HPP
#define SCHEDULE_RISK_INTERPRETATION_HPP

#include "schedule_risk/simulation_result.hpp"
#include <string>

namespace sr {

enum class Likelihood {
    HIGH,      // probability >= 0.8
    MODERATE,  // probability >= 0.5
    LOW
};

constexpr double HIGH_LIKELIHOOD = 0.8;
constexpr double MODERATE_LIKELIHOOD = 0.5;

Likelihood classify(double probability);

std::string headline(Likelihood likelihood);
std::string advice(Likelihood likelihood);

// "Based on N simulation trials, there is a P% chance of completing both
// tasks within the available T hours."
std::string summarize(const SimulationResult& result);

// Probability as a percentage with one decimal, e.g. "72.4%".
std::string formatPercent(double probability);

} // namespace sr

#endif // SCHEDULE_RISK_INTERPRETATION_HPP
