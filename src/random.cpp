#include "schedule_risk/random.hpp"
#include "schedule_risk/errors.hpp"
#include <stdexcept>

namespace sr {

namespace {

// Top 53 bits of a 64-bit word scaled into [0, 1).
constexpr double TWO_POW_MINUS_53 = 1.0 / 9007199254740992.0;

std::uint64_t nonzero(std::uint64_t seed_value) {
    return seed_value == 0 ? 1 : seed_value;
}

std::uint64_t entropy() {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32) | device();
}

} // namespace

double RandomGenerator::uniform(double lo, double hi) {
    if (lo == hi) return lo;
    return lo + (hi - lo) * generate();
}

MersenneTwisterGenerator::MersenneTwisterGenerator()
    : MersenneTwisterGenerator(entropy()) {}

MersenneTwisterGenerator::MersenneTwisterGenerator(std::uint64_t seed_value)
    : engine_(seed_value)
    , unit_(0.0, 1.0) {}

double MersenneTwisterGenerator::generate() {
    return unit_(engine_);
}

void MersenneTwisterGenerator::seed(std::uint64_t seed_value) {
    engine_.seed(seed_value);
    unit_.reset();
}

XorShiftGenerator::XorShiftGenerator()
    : XorShiftGenerator(entropy()) {}

XorShiftGenerator::XorShiftGenerator(std::uint64_t seed_value)
    : state_(nonzero(seed_value)) {}

double XorShiftGenerator::generate() {
    state_ ^= state_ << 13;
    state_ ^= state_ >> 7;
    state_ ^= state_ << 17;
    return static_cast<double>(state_ >> 11) * TWO_POW_MINUS_53;
}

void XorShiftGenerator::seed(std::uint64_t seed_value) {
    state_ = nonzero(seed_value);
}

std::unique_ptr<RandomGenerator> RandomGenerator::create(RandomGeneratorType type) {
    return create(type, entropy());
}

std::unique_ptr<RandomGenerator> RandomGenerator::create(RandomGeneratorType type,
                                                         std::uint64_t seed_value) {
    switch (type) {
        case RandomGeneratorType::MERSENNE_TWISTER:
            return std::make_unique<MersenneTwisterGenerator>(seed_value);
        case RandomGeneratorType::XOR_SHIFT:
            return std::make_unique<XorShiftGenerator>(seed_value);
    }
    throw std::runtime_error("Unknown random generator type");
}

RandomGeneratorType parseGeneratorType(const std::string& name) {
    if (name == "mt" || name == "mersenne") return RandomGeneratorType::MERSENNE_TWISTER;
    if (name == "xorshift") return RandomGeneratorType::XOR_SHIFT;
    throw InvalidParameter("Unknown generator: " + name + " (expected mt or xorshift)");
}

} // namespace sr
