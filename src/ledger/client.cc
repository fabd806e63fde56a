#include "client.hh"
#include "core/logging.hh"
#include <random>
#include <thread>

namespace coanneal {

namespace {

// Distinct clients of the same identity must not produce identical payloads
nonce_t initial_nonce() {
    std::random_device rd;
    return (static_cast<nonce_t>(rd()) << 32) | 1;
}

}  // namespace

LedgerClient::LedgerClient(std::shared_ptr<Ledger> ledger, ClientConfig config)
    : ledger_(std::move(ledger))
    , config_(config)
    , nonce_(initial_nonce()) {}

SubmitResult LedgerClient::submit(std::vector<Command> commands, const Identity& signer) {
    if (!signer.can_sign()) {
        log::client.warn() << signer.account_id() << " has no secret key";
        return SubmitResult{Status::INVALID_SIGNATURE, "signer has no secret key", {}};
    }

    Transaction tx;
    tx.creator_account_id = signer.account_id();
    tx.created_time_ms = now_ms();
    tx.nonce = next_nonce();
    tx.commands = std::move(commands);

    auto signed_tx = SignedTransaction::sign(std::move(tx), signer.keys());
    if (!signed_tx) {
        return SubmitResult{Status::INVALID_SIGNATURE, "signing failed", {}};
    }

    const auto hash = signed_tx->hash();
    auto submitted = ledger_->submit(*signed_tx);
    if (submitted.state == TxState::REJECTED) {
        COANNEAL_LOG_DEBUG(log::client) << signer.account_id() << " tx rejected on submit: "
                                        << status_string(submitted.error) << " "
                                        << submitted.reason;
        return SubmitResult{submitted.error, std::move(submitted.reason), hash};
    }
    if (submitted.state == TxState::COMMITTED) {
        return SubmitResult{Status::OK, {}, hash};
    }
    return wait_for_commit(hash);
}

SubmitResult LedgerClient::wait_for_commit(const hash_t& hash) {
    const auto deadline = std::chrono::steady_clock::now() + config_.commit_timeout;

    while (true) {
        auto current = ledger_->status(hash);
        switch (current.state) {
            case TxState::COMMITTED:
                return SubmitResult{Status::OK, {}, hash};
            case TxState::REJECTED:
                COANNEAL_LOG_DEBUG(log::client) << "tx rejected: "
                                                << status_string(current.error) << " "
                                                << current.reason;
                return SubmitResult{current.error, std::move(current.reason), hash};
            case TxState::UNKNOWN:
                log::client.warn("Ledger does not know a submitted transaction");
                return SubmitResult{Status::TRANSACTION_REJECTED,
                                    "transaction unknown to ledger", hash};
            case TxState::PENDING:
                break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            log::client.warn() << "Commit timeout after " << config_.commit_timeout.count()
                               << "ms";
            return SubmitResult{Status::TIMEOUT, "commit timeout", hash};
        }
        std::this_thread::sleep_for(config_.status_poll_interval);
    }
}

QueryResponse LedgerClient::query(QueryPayload payload, const Identity& signer) {
    if (!signer.can_sign()) {
        return QueryResponse::failure(Status::INVALID_SIGNATURE, "signer has no secret key");
    }

    Query q;
    q.creator_account_id = signer.account_id();
    q.created_time_ms = now_ms();
    q.counter = next_nonce();
    q.payload = std::move(payload);

    auto signed_query = SignedQuery::sign(std::move(q), signer.keys());
    if (!signed_query) {
        return QueryResponse::failure(Status::INVALID_SIGNATURE, "signing failed");
    }
    return ledger_->query(*signed_query);
}

}  // namespace coanneal
