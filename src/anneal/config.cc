#include "config.hh"
#include "anneal/codec.hh"
#include "core/types.hh"
#include <cmath>
#include <limits>
#include <set>

namespace coanneal {

std::optional<std::string> validate(const AnnealConfig& config) {
    if (config.workers.empty()) {
        return "no workers configured";
    }

    std::set<std::string> seen;
    for (const auto& worker : config.workers) {
        if (!worker.account.is_valid()) {
            return "invalid worker account '" + worker.account.to_string() + "'";
        }
        if (worker.address.empty()) {
            return "worker " + worker.account.to_string() + " has no address";
        }
        if (!seen.insert(worker.account.to_string()).second) {
            return "duplicate worker " + worker.account.to_string();
        }
    }

    if (!is_valid_domain_id(config.domain)) {
        return "invalid domain '" + config.domain + "'";
    }
    if (config.objective.empty()) {
        return "objective name is empty";
    }

    if (config.initial_beta.empty()) {
        return "initial beta is empty";
    }
    for (double b : config.initial_beta) {
        if (!std::isfinite(b)) {
            return "initial beta has a non-finite coordinate";
        }
    }
    // Worst case: largest round id and full-precision coordinates
    std::vector<double> widest(config.initial_beta.size(), -1.2345678901234567e-300);
    if (encode_parameters(std::numeric_limits<round_t>::max(), widest).size() > MAX_DETAIL_VALUE_SIZE) {
        return "beta has too many coordinates to fit one detail value";
    }

    if (!(config.perturbation > 0.0) || !std::isfinite(config.perturbation)) {
        return "perturbation must be positive";
    }

    const auto& s = config.schedule;
    if (!(s.initial_temperature > 0.0) || !std::isfinite(s.initial_temperature)) {
        return "initial temperature must be positive";
    }
    if (!(s.alpha > 0.0 && s.alpha < 1.0)) {
        return "alpha must lie in (0, 1)";
    }
    if (!(s.min_temperature > 0.0)) {
        return "minimum temperature must be positive";
    }
    if (s.iterations_per_temperature == 0) {
        return "iterations per temperature must be positive";
    }

    if (config.timeouts.collect.count() <= 0) {
        return "collect timeout must be positive";
    }
    if (config.timeouts.poll_interval.count() <= 0) {
        return "poll interval must be positive";
    }
    if (config.max_consecutive_incomplete_rounds == 0) {
        return "max consecutive incomplete rounds must be positive";
    }
    return std::nullopt;
}

}  // namespace coanneal
