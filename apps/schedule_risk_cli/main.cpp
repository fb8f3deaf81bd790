#include "schedule_risk/schedule_risk.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sr;

namespace {

constexpr int EXIT_INVALID_INPUT = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_RUNTIME_ERROR = 3;
constexpr size_t BAR_WIDTH = 40;

struct CliOptions {
    SimulationRequest request;
    std::optional<std::uint64_t> seed;
    RandomGeneratorType generator = RandomGeneratorType::MERSENNE_TWISTER;
    size_t bins = DEFAULT_NUM_BINS;
};

void print_usage(std::ostream& out) {
    out << "Usage: schedule_risk_cli [--a-min H] [--a-max H] [--b-min H] [--b-max H]\n"
        << "                         [--hours H] [--trials N] [--seed S] [--bins K]\n"
        << "                         [--generator mt|xorshift]\n";
}

double parse_double(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    return parsed;
}

unsigned long long parse_count(const std::string& flag, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("Invalid count for " + flag + ": " + value);
    }
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid count for " + flag + ": " + value);
    }
    return parsed;
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        const std::string value = argv[++i];

        if (flag == "--a-min") {
            options.request.taskA.minDuration = parse_double(flag, value);
        } else if (flag == "--a-max") {
            options.request.taskA.maxDuration = parse_double(flag, value);
        } else if (flag == "--b-min") {
            options.request.taskB.minDuration = parse_double(flag, value);
        } else if (flag == "--b-max") {
            options.request.taskB.maxDuration = parse_double(flag, value);
        } else if (flag == "--hours") {
            options.request.threshold = parse_double(flag, value);
        } else if (flag == "--trials") {
            options.request.trialCount = static_cast<size_t>(parse_count(flag, value));
        } else if (flag == "--seed") {
            options.seed = static_cast<std::uint64_t>(parse_count(flag, value));
        } else if (flag == "--generator") {
            options.generator = parseGeneratorType(value);
        } else if (flag == "--bins") {
            options.bins = static_cast<size_t>(parse_count(flag, value));
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }
    return options;
}

void print_summary(const SimulationResult& result) {
    std::cout << "\n--- Simulation Summary ---\n";
    std::cout << "Success probability: " << formatPercent(result.probability()) << "\n";
    std::cout << "Successful trials:   " << result.successCount()
              << " of " << result.totalTrials() << "\n";
    std::cout << "Available time:      " << result.threshold() << " hours\n";
    std::cout << "95% Confidence Interval: ["
              << formatPercent(result.confidenceInterval95Low()) << ", "
              << formatPercent(result.confidenceInterval95High()) << "]\n";

    const auto stats = result.durationStats({0.1, 0.9});
    std::cout << "Mean total duration: " << stats.mean << " hours"
              << " (median " << stats.median << ", 10th-90th percentile "
              << stats.quantiles[0] << "-" << stats.quantiles[1] << ")\n";
}

void print_histogram(const std::vector<BinSummary>& bins) {
    size_t max_count = 0;
    for (const auto& b : bins) {
        max_count = std::max(max_count, b.count);
    }

    std::cout << "\n--- Distribution of Task Completion Times ---\n";
    for (const auto& b : bins) {
        const size_t width = max_count == 0 ? 0 : b.count * BAR_WIDTH / max_count;
        std::cout << std::setw(13) << std::left << b.range << std::right << " | "
                  << std::string(width, b.isSuccess ? '+' : '-')
                  << " " << b.count << " (" << formatPercent(b.percentage / 100.0) << ")\n";
    }
    std::cout << "('+' bins finish within the available time, '-' bins may not)\n";
}

void print_interpretation(const SimulationRequest& request, const SimulationResult& result) {
    const Likelihood likelihood = classify(result.probability());
    std::cout << "\n--- What This Means ---\n";
    std::cout << summarize(result) << "\n\n";
    std::cout << "Task Characteristics:\n";
    for (const TaskSpec* task : {&request.taskA, &request.taskB}) {
        const UniformDistribution<> duration(task->minDuration, task->maxDuration);
        std::cout << "  - " << task->name << ": takes between " << duration.min()
                  << " and " << duration.max() << " hours (" << duration.mean()
                  << " on average)\n";
    }
    std::cout << "\n" << headline(likelihood) << "\n" << advice(likelihood) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    try {
        options = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    try {
        validateRequest(options.request);
        if (options.bins == 0 || options.bins > MAX_NUM_BINS) {
            throw InvalidParameter("Number of bins must be between 1 and " +
                                   std::to_string(MAX_NUM_BINS));
        }

        std::unique_ptr<RandomGenerator> generator =
            options.seed ? RandomGenerator::create(options.generator, *options.seed)
                         : RandomGenerator::create(options.generator);

        std::cout << "Running " << options.request.trialCount << " simulations ("
                  << generator->name() << ")...\n";
        SimulationEngine engine;
        const SimulationResult result = engine.run(options.request, *generator);

        print_summary(result);
        print_histogram(bin(result, options.bins));
        print_interpretation(options.request, result);
    } catch (const InvalidParameter& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        return EXIT_INVALID_INPUT;
    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << "\n";
        return EXIT_RUNTIME_ERROR;
    }
    return 0;
}
