#pragma once

#include "ledger/ledger.hh"
#include "identity/identity.hh"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace coanneal {

// ============================================================================
// Roles
// ============================================================================

using RolePermissions = std::uint32_t;

namespace role_permission {
inline constexpr RolePermissions CAN_CREATE_DOMAIN = 1u << 0;
inline constexpr RolePermissions CAN_CREATE_ACCOUNT = 1u << 1;
inline constexpr RolePermissions CAN_CREATE_ASSET = 1u << 2;
inline constexpr RolePermissions CAN_ADD_ASSET_QTY = 1u << 3;
inline constexpr RolePermissions CAN_GET_ALL_ACC_DETAIL = 1u << 4;
inline constexpr RolePermissions CAN_SET_ALL_ACC_DETAIL = 1u << 5;
inline constexpr RolePermissions ALL = 0x3F;
inline constexpr RolePermissions NONE = 0;
}  // namespace role_permission

inline constexpr std::string_view ADMIN_ROLE = "admin";
inline constexpr std::string_view USER_ROLE = "user";

// ============================================================================
// Memory Ledger Configuration
// ============================================================================

struct MemoryLedgerConfig {
    // Delay between submission and visibility of a transaction
    std::chrono::milliseconds commit_latency{0};

    // Accepted window for Transaction::created_time_ms relative to the ledger clock
    std::uint64_t max_past_ms = 24ULL * 60 * 60 * 1000;
    std::uint64_t max_future_ms = 5ULL * 60 * 1000;

    std::size_t max_commands_per_tx = 1024;
};

// ============================================================================
// Memory Ledger - in-process permissioned ledger
// ============================================================================

class MemoryLedger : public Ledger {
public:
    explicit MemoryLedger(MemoryLedgerConfig config = {});

    // Genesis block: admin/user roles, one domain (default role "user") and the
    // admin account. Returns false if called twice.
    bool genesis(const std::string& domain_id,
                 const AccountId& admin,
                 const mldsa_public_key_t& admin_key);

    void define_role(const std::string& name, RolePermissions permissions);

    // Ledger interface
    TxStatus submit(const SignedTransaction& tx) override;
    [[nodiscard]] TxStatus status(const hash_t& tx_hash) override;
    [[nodiscard]] QueryResponse query(const SignedQuery& query) override;

    // Commit everything still pending, ignoring the configured latency
    void flush();

    void set_commit_latency(std::chrono::milliseconds latency);

    // Inspection (committed state only)
    [[nodiscard]] bool account_exists(const std::string& account_id) const;
    [[nodiscard]] bool has_grant(const std::string& grantor,
                                 const std::string& grantee,
                                 GrantablePermission permission) const;
    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] std::uint64_t committed_count() const;
    [[nodiscard]] std::uint64_t rejected_count() const;

private:
    struct AccountRecord {
        AccountId id;
        mldsa_public_key_t public_key;
        std::string role;
        DetailMap details;                            // writer -> key -> value
        std::map<std::string, amount_t> balances;     // asset id -> amount
    };

    struct AssetRecord {
        std::string domain_id;
        std::uint8_t precision = 0;
    };

    struct GrantKey {
        std::string grantor;
        std::string grantee;
        GrantablePermission permission;

        auto operator<=>(const GrantKey&) const = default;
    };

    struct State {
        std::map<std::string, Domain> domains;
        std::map<std::string, RolePermissions> roles;
        std::unordered_map<std::string, AccountRecord> accounts;
        std::map<std::string, AssetRecord> assets;
        std::set<GrantKey> grants;
    };

    struct PendingTx {
        hash_t hash;
        SignedTransaction tx;
        steady_time_t visible_at;
    };

    struct CommandResult {
        Status status = Status::OK;
        std::string reason;

        [[nodiscard]] bool ok() const { return status == Status::OK; }
    };

    MemoryLedgerConfig config_;
    State state_;
    std::deque<PendingTx> pending_;
    std::unordered_map<hash_t, TxStatus> statuses_;
    std::uint64_t committed_ = 0;
    std::uint64_t rejected_ = 0;
    bool genesis_done_ = false;
    mutable std::mutex mutex_;

    // All of the following require mutex_ to be held
    void commit_due(steady_time_t now);
    void commit(const PendingTx& pending);
    [[nodiscard]] TxStatus reject(const hash_t& hash, Status error, std::string reason);
    [[nodiscard]] CommandResult execute(State& state, const AccountRecord& creator,
                                        const Command& command) const;
    [[nodiscard]] RolePermissions permissions_of(const State& state,
                                                 const AccountRecord& account) const;
    [[nodiscard]] QueryResponse run_query(const AccountRecord& creator,
                                          const QueryPayload& payload) const;

    [[nodiscard]] static CommandResult check_stateless(const Command& command);
};

}  // namespace coanneal
