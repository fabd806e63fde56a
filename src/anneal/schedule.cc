#include "schedule.hh"
#include <cmath>

namespace coanneal {

std::uint64_t CoolingSchedule::temperature_levels() const {
    if (!(alpha > 0.0 && alpha < 1.0) || !(min_temperature > 0.0)) {
        return 0;
    }
    std::uint64_t levels = 0;
    for (double t = initial_temperature; !finished(t); t = next(t)) {
        ++levels;
    }
    return levels;
}

double acceptance_probability(double current_cost, double new_cost, double temperature) {
    if (temperature <= 0.0) {
        return new_cost > current_cost ? 1.0 : 0.0;
    }
    return std::exp((new_cost - current_cost) / temperature);
}

std::vector<double> perturb(std::span<const double> beta, double magnitude,
                            std::mt19937_64& rng) {
    std::vector<double> proposal(beta.begin(), beta.end());
    if (proposal.empty()) {
        return proposal;
    }

    std::uniform_int_distribution<std::size_t> pick(0, proposal.size() - 1);
    std::uniform_real_distribution<double> offset(-magnitude, magnitude);

    const auto index = pick(rng);
    proposal[index] += offset(rng);
    return proposal;
}

}  // namespace coanneal
