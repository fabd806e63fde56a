#pragma once

#include "anneal/schedule.hh"
#include "worker/protocol.hh"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace coanneal {

// ============================================================================
// Annealing Configuration
// ============================================================================

struct AnnealTimeouts {
    // Upper bound for collecting every worker's cost of one round
    std::chrono::milliseconds collect{5000};
    std::chrono::milliseconds poll_interval{10};
};

struct AnnealConfig {
    std::vector<WorkerEndpoint> workers;
    std::string domain;
    std::string network_location;
    std::string objective = "default";

    std::vector<double> initial_beta;
    double perturbation = 0.01;
    CoolingSchedule schedule;
    AnnealTimeouts timeouts;

    // Publish, trigger and collect per worker concurrently (joined per phase)
    bool parallel_fanout = false;

    std::uint32_t max_consecutive_incomplete_rounds = 10;

    // Fixed seed for reproducible proposals; random when unset
    std::optional<std::uint64_t> seed;
};

// First problem found, or nullopt when the configuration is usable
[[nodiscard]] std::optional<std::string> validate(const AnnealConfig& config);

}  // namespace coanneal
