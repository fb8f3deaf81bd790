#ifndef SCHEDULE_RISK_DISTRIBUTIONS_HPP
#define SCHEDULE_RISK_DISTRIBUTIONS_HPP

#include "schedule_risk/errors.hpp"
#include "schedule_risk/random.hpp"
#include <cmath>

namespace sr {

// Continuous uniform over [min, max]. min == max is allowed and yields a
// point mass, which is how a task with a fixed duration is modelled.
template<typename T = double>
class UniformDistribution {
public:
    UniformDistribution(T min = 0.0, T max = 1.0)
        : min_(min), max_(max) {
        if (!std::isfinite(min) || !std::isfinite(max)) {
            throw InvalidParameter("Bounds must be finite");
        }
        if (min > max) {
            throw InvalidParameter("Min must be less than or equal to max");
        }
    }

    T sample(RandomGenerator& generator) const {
        return static_cast<T>(generator.uniform(min_, max_));
    }

    T min() const { return min_; }
    T max() const { return max_; }
    T width() const { return max_ - min_; }
    bool isDegenerate() const { return min_ == max_; }

    T mean() const { return (min_ + max_) / 2; }

    T cdf(T x) const {
        if (x < min_) return 0.0;
        if (x >= max_) return 1.0;
        return (x - min_) / (max_ - min_);
    }

private:
    T min_;
    T max_;
};

} // namespace sr

#endif // SCHEDULE_RISK_DISTRIBUTIONS_HPP
