#pragma once

#include "anneal/codec.hh"
#include <cstdint>
#include <string_view>
#include <vector>

namespace coanneal {

// ============================================================================
// Annealing State
// ============================================================================

enum class AnnealPhase : std::uint8_t {
    INIT,
    DISTRIBUTE,
    COLLECT,
    DECIDE,
    COOL,
    TERMINATED,
};

[[nodiscard]] inline std::string_view phase_string(AnnealPhase phase) {
    switch (phase) {
        case AnnealPhase::INIT: return "init";
        case AnnealPhase::DISTRIBUTE: return "distribute";
        case AnnealPhase::COLLECT: return "collect";
        case AnnealPhase::DECIDE: return "decide";
        case AnnealPhase::COOL: return "cool";
        case AnnealPhase::TERMINATED: return "terminated";
    }
    return "unknown";
}

// One accepted proposal
struct HistoryEntry {
    std::uint64_t iteration = 0;
    round_t round = 0;
    std::vector<double> beta;
    double cost = 0.0;
    double temperature = 0.0;
};

struct AnnealState {
    std::vector<double> beta;
    double current_cost = 0.0;
    double temperature = 0.0;
    std::uint64_t iteration = 0;          // Evaluated proposals
    std::vector<HistoryEntry> history;    // Append-only
};

struct AnnealCounters {
    std::uint64_t rounds = 0;             // Rounds started, baseline included
    std::uint64_t evaluated = 0;
    std::uint64_t accepted = 0;
    std::uint64_t rejected = 0;
    std::uint64_t incomplete = 0;
    std::uint64_t temperature_steps = 0;
};

}  // namespace coanneal
