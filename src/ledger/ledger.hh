#pragma once

#include "core/types.hh"
#include "core/status.hh"
#include "ledger/transaction.hh"
#include "ledger/query.hh"
#include <string>
#include <string_view>

namespace coanneal {

// ============================================================================
// Transaction Status
// ============================================================================

enum class TxState : std::uint8_t {
    UNKNOWN = 0,      // Ledger has never seen this hash
    PENDING = 1,      // Accepted for ordering, not yet committed
    COMMITTED = 2,    // Durable and visible to queries
    REJECTED = 3,     // Failed stateless or stateful validation
};

[[nodiscard]] inline std::string_view tx_state_string(TxState state) {
    switch (state) {
        case TxState::UNKNOWN: return "unknown";
        case TxState::PENDING: return "pending";
        case TxState::COMMITTED: return "committed";
        case TxState::REJECTED: return "rejected";
    }
    return "unknown";
}

struct TxStatus {
    TxState state = TxState::UNKNOWN;
    Status error = Status::OK;     // Set when state == REJECTED
    std::string reason;

    [[nodiscard]] bool is_final() const {
        return state == TxState::COMMITTED || state == TxState::REJECTED;
    }
};

// ============================================================================
// Ledger - boundary to the consensus-backed store
// ============================================================================
//
// All calls block. submit() only performs stateless checks and ordering;
// stateful validation happens at commit time and is observed through status().
// Queries see committed state only.

class Ledger {
public:
    virtual ~Ledger() = default;

    virtual TxStatus submit(const SignedTransaction& tx) = 0;
    [[nodiscard]] virtual TxStatus status(const hash_t& tx_hash) = 0;
    [[nodiscard]] virtual QueryResponse query(const SignedQuery& query) = 0;
};

}  // namespace coanneal
