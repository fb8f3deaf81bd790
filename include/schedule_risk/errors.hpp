#ifndef SCHEDULE_RISK_ERRORS_HPP
#define SCHEDULE_RISK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sr {

// Raised for any precondition violation, before sampling starts.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

class SimulationCancelled : public std::runtime_error {
public:
    SimulationCancelled()
        : std::runtime_error("Simulation cancelled") {}
};

} // namespace sr

#endif // SCHEDULE_RISK_ERRORS_HPP
