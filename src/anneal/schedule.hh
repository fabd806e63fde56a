#pragma once

#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace coanneal {

// ============================================================================
// Cooling Schedule
// ============================================================================

struct CoolingSchedule {
    double initial_temperature = 1.0;
    double alpha = 0.9;                           // Geometric cooling factor, (0, 1)
    double min_temperature = 1e-5;                // Terminate once T drops below
    std::uint32_t iterations_per_temperature = 500;

    [[nodiscard]] double next(double temperature) const { return temperature * alpha; }
    [[nodiscard]] bool finished(double temperature) const { return temperature < min_temperature; }

    // Number of cooling steps from initial_temperature until finished()
    [[nodiscard]] std::uint64_t temperature_levels() const;
};

// exp((new_cost - current_cost) / temperature). Values above 1 always accept.
// Higher cost is better: the loop maximizes the aggregate.
[[nodiscard]] double acceptance_probability(double current_cost, double new_cost,
                                            double temperature);

// Copy of beta with one uniformly chosen coordinate moved by a uniform
// offset in [-magnitude, +magnitude]
[[nodiscard]] std::vector<double> perturb(std::span<const double> beta, double magnitude,
                                          std::mt19937_64& rng);

}  // namespace coanneal
