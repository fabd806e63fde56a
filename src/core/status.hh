#pragma once

#include <cstdint>
#include <string_view>

namespace coanneal {

// ============================================================================
// Status Codes
// ============================================================================

enum class Status : std::uint8_t {
    OK = 0x00,
    TRANSACTION_REJECTED = 0x01,  // Stateful validation failed (duplicate, malformed, balance)
    QUERY_DENIED = 0x02,          // Missing signature or no read visibility
    NOT_FOUND = 0x03,             // Target account/asset/transaction unknown to the ledger
    PERMISSION_DENIED = 0x04,     // Write into another account without a grant
    VALUE_TOO_LARGE = 0x05,       // Detail value over MAX_DETAIL_VALUE_SIZE
    INVALID_ARGUMENT = 0x06,      // Malformed key, id or amount
    INVALID_SIGNATURE = 0x07,     // Signing impossible or signature rejected
    TIMEOUT = 0x08,               // Bounded wait elapsed
    WORKER_UNREACHABLE = 0x09,    // Transport could not deliver the trigger
    WORKER_FAILED = 0x0A,         // Worker reported a failure or returned garbage
    INCOMPLETE_ROUND = 0x0B,      // Not every worker contributed a cost
    CANCELLED = 0x0C,             // Stopped by the caller
};

[[nodiscard]] constexpr std::string_view status_string(Status status) {
    switch (status) {
        case Status::OK: return "ok";
        case Status::TRANSACTION_REJECTED: return "transaction_rejected";
        case Status::QUERY_DENIED: return "query_denied";
        case Status::NOT_FOUND: return "not_found";
        case Status::PERMISSION_DENIED: return "permission_denied";
        case Status::VALUE_TOO_LARGE: return "value_too_large";
        case Status::INVALID_ARGUMENT: return "invalid_argument";
        case Status::INVALID_SIGNATURE: return "invalid_signature";
        case Status::TIMEOUT: return "timeout";
        case Status::WORKER_UNREACHABLE: return "worker_unreachable";
        case Status::WORKER_FAILED: return "worker_failed";
        case Status::INCOMPLETE_ROUND: return "incomplete_round";
        case Status::CANCELLED: return "cancelled";
    }
    return "unknown";
}

}  // namespace coanneal
