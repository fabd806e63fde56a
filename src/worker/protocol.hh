#pragma once

#include "core/types.hh"
#include "anneal/codec.hh"
#include <string>
#include <string_view>

namespace coanneal {

// ============================================================================
// Worker Invocation Protocol
// ============================================================================

inline constexpr std::string_view COMPUTE_COST_PROCEDURE = "compute_cost";

// Asks a worker to evaluate the parameters `writer` published into the
// worker's account for `round`. The cost goes back through the ledger.
struct ComputeCostRequest {
    std::string procedure{COMPUTE_COST_PROCEDURE};
    std::string writer_name;
    std::string domain;
    std::string network_location;
    std::string objective;
    round_t round = 0;

    [[nodiscard]] AccountId writer() const { return AccountId{writer_name, domain}; }
};

// A worker as seen from the master: where to write, where to call
struct WorkerEndpoint {
    AccountId account;
    std::string address;
};

}  // namespace coanneal
