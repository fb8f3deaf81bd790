#ifndef SCHEDULE_RISK_RANDOM_HPP
#define SCHEDULE_RISK_RANDOM_HPP

#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace sr {

enum class RandomGeneratorType {
    MERSENNE_TWISTER,
    XOR_SHIFT
};

// Source of uniform variates. Trials only ever ask for uniform(lo, hi), so a
// seeded or scripted generator can be swapped in without touching the engine.
class RandomGenerator {
public:
    virtual ~RandomGenerator() = default;

    // Uniform real in [0, 1).
    virtual double generate() = 0;
    virtual void seed(std::uint64_t seed_value) = 0;
    virtual std::string name() const = 0;

    // Uniform real in [lo, hi]. Returns lo exactly, without drawing, when lo == hi.
    double uniform(double lo, double hi);

    static std::unique_ptr<RandomGenerator> create(
        RandomGeneratorType type = RandomGeneratorType::MERSENNE_TWISTER);
    static std::unique_ptr<RandomGenerator> create(
        RandomGeneratorType type, std::uint64_t seed_value);
};

// "mt" / "mersenne" or "xorshift". Throws InvalidParameter for anything else.
RandomGeneratorType parseGeneratorType(const std::string& name);

class MersenneTwisterGenerator : public RandomGenerator {
public:
    MersenneTwisterGenerator();
    explicit MersenneTwisterGenerator(std::uint64_t seed_value);

    double generate() override;
    void seed(std::uint64_t seed_value) override;
    std::string name() const override { return "Mersenne Twister"; }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> unit_;
};

// xorshift64 (13, 7, 17). The state is never allowed to be zero.
class XorShiftGenerator : public RandomGenerator {
public:
    XorShiftGenerator();
    explicit XorShiftGenerator(std::uint64_t seed_value);

    double generate() override;
    void seed(std::uint64_t seed_value) override;
    std::string name() const override { return "XorShift"; }

private:
    std::uint64_t state_;
};

} // namespace sr

#endif // SCHEDULE_RISK_RANDOM_HPP
