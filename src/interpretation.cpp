#include "schedule_risk/interpretation.hpp"
#include <iomanip>
#include <sstream>

namespace sr {

Likelihood classify(double probability) {
    if (probability >= HIGH_LIKELIHOOD) return Likelihood::HIGH;
    if (probability >= MODERATE_LIKELIHOOD) return Likelihood::MODERATE;
    return Likelihood::LOW;
}

std::string headline(Likelihood likelihood) {
    switch (likelihood) {
        case Likelihood::HIGH:
            return "High Probability of Success";
        case Likelihood::MODERATE:
            return "Moderate Probability of Success";
        case Likelihood::LOW:
            return "Low Probability of Success";
    }
    return "Low Probability of Success";
}

std::string advice(Likelihood likelihood) {
    switch (likelihood) {
        case Likelihood::HIGH:
            return "You have a good chance of completing both tasks before the event.";
        case Likelihood::MODERATE:
            return "You have about a 50/50 chance of completing both tasks in time. "
                   "Consider allowing more time if possible.";
        case Likelihood::LOW:
            return "It's unlikely you'll complete both tasks in time. Consider allocating "
                   "more time or prioritizing one task over the other.";
    }
    return {};
}

std::string formatPercent(double probability) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << probability * 100.0 << '%';
    return out.str();
}

std::string summarize(const SimulationResult& result) {
    std::ostringstream out;
    out << "Based on " << result.totalTrials() << " simulation trials, there is a "
        << formatPercent(result.probability())
        << " chance of completing both tasks within the available "
        << result.threshold() << " hours.";
    return out.str();
}

} // namespace sr
