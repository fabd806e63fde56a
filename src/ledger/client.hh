#pragma once

#include "ledger/ledger.hh"
#include "identity/identity.hh"
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace coanneal {

// ============================================================================
// Client Configuration
// ============================================================================

struct ClientConfig {
    std::chrono::milliseconds status_poll_interval{5};
    std::chrono::milliseconds commit_timeout{5000};
};

struct SubmitResult {
    Status status = Status::OK;
    std::string reason;
    hash_t tx_hash{};

    [[nodiscard]] bool ok() const { return status == Status::OK; }
};

// ============================================================================
// Ledger Client - signs, submits and waits for finality
// ============================================================================

class LedgerClient {
public:
    explicit LedgerClient(std::shared_ptr<Ledger> ledger, ClientConfig config = {});

    // Build a transaction from the commands, sign it with the signer's key and
    // block until the ledger reports a final status or commit_timeout passes.
    SubmitResult submit(std::vector<Command> commands, const Identity& signer);

    // Signed query on behalf of the signer
    [[nodiscard]] QueryResponse query(QueryPayload payload, const Identity& signer);

    [[nodiscard]] nonce_t next_nonce() { return nonce_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] const ClientConfig& config() const { return config_; }
    [[nodiscard]] const std::shared_ptr<Ledger>& ledger() const { return ledger_; }

private:
    std::shared_ptr<Ledger> ledger_;
    ClientConfig config_;
    std::atomic<nonce_t> nonce_;

    SubmitResult wait_for_commit(const hash_t& hash);
};

}  // namespace coanneal
