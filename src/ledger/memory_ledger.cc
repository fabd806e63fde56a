#include "memory_ledger.hh"
#include "core/logging.hh"
#include <limits>
#include <type_traits>

namespace coanneal {

namespace {

std::string describe(const hash_t& hash) {
    return bytes_to_hex(std::span<const std::uint8_t>(hash.data(), 8));
}

}  // namespace

// ============================================================================
// MemoryLedger Implementation
// ============================================================================

MemoryLedger::MemoryLedger(MemoryLedgerConfig config)
    : config_(config) {}

bool MemoryLedger::genesis(const std::string& domain_id,
                           const AccountId& admin,
                           const mldsa_public_key_t& admin_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (genesis_done_) {
        log::memory_ledger.warn("Genesis already applied");
        return false;
    }
    if (!is_valid_domain_id(domain_id) || !admin.is_valid() || admin.domain != domain_id) {
        log::memory_ledger.error() << "Invalid genesis parameters for " << admin.to_string();
        return false;
    }

    state_.roles[std::string(ADMIN_ROLE)] = role_permission::ALL;
    state_.roles.try_emplace(std::string(USER_ROLE), role_permission::NONE);
    state_.domains[domain_id] = Domain{domain_id, std::string(USER_ROLE)};

    AccountRecord record;
    record.id = admin;
    record.public_key = admin_key;
    record.role = std::string(ADMIN_ROLE);
    state_.accounts[admin.to_string()] = std::move(record);

    genesis_done_ = true;
    log::memory_ledger.info() << "Genesis: domain " << domain_id
                              << ", admin " << admin.to_string();
    return true;
}

void MemoryLedger::define_role(const std::string& name, RolePermissions permissions) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.roles[name] = permissions;
}

void MemoryLedger::set_commit_latency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.commit_latency = latency;
}

TxStatus MemoryLedger::submit(const SignedTransaction& tx) {
    const auto hash = tx.hash();
    const auto now = std::chrono::steady_clock::now();

    // Stateless validation happens outside the lock
    Status stateless_error = Status::OK;
    std::string stateless_reason;

    if (tx.tx.commands.empty()) {
        stateless_error = Status::TRANSACTION_REJECTED;
        stateless_reason = "transaction has no commands";
    } else if (tx.tx.commands.size() > config_.max_commands_per_tx) {
        stateless_error = Status::TRANSACTION_REJECTED;
        stateless_reason = "too many commands";
    } else if (!AccountId::parse(tx.tx.creator_account_id)) {
        stateless_error = Status::INVALID_ARGUMENT;
        stateless_reason = "malformed creator account id";
    } else {
        const auto wall = now_ms();
        const auto created = tx.tx.created_time_ms;
        if (created + config_.max_past_ms < wall || created > wall + config_.max_future_ms) {
            stateless_error = Status::TRANSACTION_REJECTED;
            stateless_reason = "created time outside accepted window";
        }
    }
    if (stateless_error == Status::OK) {
        for (const auto& command : tx.tx.commands) {
            auto result = check_stateless(command);
            if (!result.ok()) {
                stateless_error = result.status;
                stateless_reason = std::move(result.reason);
                break;
            }
        }
    }
    if (stateless_error == Status::OK && !tx.verify()) {
        stateless_error = Status::INVALID_SIGNATURE;
        stateless_reason = "signature does not verify";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    commit_due(now);

    if (statuses_.contains(hash)) {
        COANNEAL_LOG_DEBUG(log::memory_ledger) << "Replay of " << describe(hash);
        return TxStatus{TxState::REJECTED, Status::TRANSACTION_REJECTED,
                        "duplicate transaction"};
    }
    if (stateless_error != Status::OK) {
        return reject(hash, stateless_error, std::move(stateless_reason));
    }

    TxStatus pending_status{TxState::PENDING, Status::OK, {}};
    statuses_[hash] = pending_status;
    pending_.push_back(PendingTx{hash, tx, now + config_.commit_latency});
    return pending_status;
}

TxStatus MemoryLedger::status(const hash_t& tx_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    commit_due(std::chrono::steady_clock::now());

    auto it = statuses_.find(tx_hash);
    if (it == statuses_.end()) {
        return TxStatus{};
    }
    return it->second;
}

QueryResponse MemoryLedger::query(const SignedQuery& query) {
    const bool signature_ok = query.verify();

    std::lock_guard<std::mutex> lock(mutex_);
    commit_due(std::chrono::steady_clock::now());

    if (!signature_ok) {
        return QueryResponse::failure(Status::QUERY_DENIED, "query signature does not verify");
    }

    auto creator = state_.accounts.find(query.query.creator_account_id);
    if (creator == state_.accounts.end()) {
        return QueryResponse::failure(Status::QUERY_DENIED, "unknown query creator");
    }
    if (creator->second.public_key != query.signer) {
        return QueryResponse::failure(Status::QUERY_DENIED,
                                      "signatory is not registered for the creator");
    }

    return run_query(creator->second, query.query.payload);
}

void MemoryLedger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_.empty()) {
        auto next = std::move(pending_.front());
        pending_.pop_front();
        commit(next);
    }
}

bool MemoryLedger::account_exists(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.accounts.contains(account_id);
}

bool MemoryLedger::has_grant(const std::string& grantor,
                             const std::string& grantee,
                             GrantablePermission permission) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.grants.contains(GrantKey{grantor, grantee, permission});
}

std::size_t MemoryLedger::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::uint64_t MemoryLedger::committed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_;
}

std::uint64_t MemoryLedger::rejected_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

// ============================================================================
// Commit Pipeline
// ============================================================================

void MemoryLedger::commit_due(steady_time_t now) {
    // Submission order is commit order; a later tx never overtakes an earlier one
    while (!pending_.empty() && pending_.front().visible_at <= now) {
        auto next = std::move(pending_.front());
        pending_.pop_front();
        commit(next);
    }
}

void MemoryLedger::commit(const PendingTx& pending) {
    const auto& tx = pending.tx.tx;

    auto creator_it = state_.accounts.find(tx.creator_account_id);
    if (creator_it == state_.accounts.end()) {
        (void)reject(pending.hash, Status::INVALID_SIGNATURE, "unknown creator account");
        return;
    }
    if (creator_it->second.public_key != pending.tx.signer) {
        (void)reject(pending.hash, Status::INVALID_SIGNATURE,
                     "signatory is not registered for the creator");
        return;
    }
    const AccountRecord creator = creator_it->second;

    // Single-command transactions apply in place; longer ones on a scratch copy
    if (tx.commands.size() == 1) {
        auto result = execute(state_, creator, tx.commands.front());
        if (!result.ok()) {
            (void)reject(pending.hash, result.status, std::move(result.reason));
            return;
        }
    } else {
        State scratch = state_;
        for (const auto& command : tx.commands) {
            auto result = execute(scratch, creator, command);
            if (!result.ok()) {
                (void)reject(pending.hash, result.status,
                             std::string(command_type_string(command_type(command))) +
                                 ": " + result.reason);
                return;
            }
        }
        state_ = std::move(scratch);
    }

    statuses_[pending.hash] = TxStatus{TxState::COMMITTED, Status::OK, {}};
    ++committed_;
    COANNEAL_LOG_DEBUG(log::memory_ledger) << "Committed " << describe(pending.hash)
                                           << " from " << tx.creator_account_id
                                           << " (" << tx.commands.size() << " commands)";
}

TxStatus MemoryLedger::reject(const hash_t& hash, Status error, std::string reason) {
    COANNEAL_LOG_DEBUG(log::memory_ledger) << "Rejected " << describe(hash) << ": "
                                           << status_string(error) << " (" << reason << ")";
    TxStatus status{TxState::REJECTED, error, std::move(reason)};
    statuses_[hash] = status;
    ++rejected_;
    return status;
}

RolePermissions MemoryLedger::permissions_of(const State& state,
                                             const AccountRecord& account) const {
    auto it = state.roles.find(account.role);
    return it == state.roles.end() ? role_permission::NONE : it->second;
}

// ============================================================================
// Command Validation
// ============================================================================

MemoryLedger::CommandResult MemoryLedger::check_stateless(const Command& command) {
    return std::visit([](const auto& cmd) -> CommandResult {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CreateDomain>) {
            if (!is_valid_domain_id(cmd.domain_id)) {
                return {Status::INVALID_ARGUMENT, "invalid domain id"};
            }
        } else if constexpr (std::is_same_v<T, CreateAccount>) {
            if (!is_valid_account_name(cmd.account_name) || !is_valid_domain_id(cmd.domain_id)) {
                return {Status::INVALID_ARGUMENT, "invalid account id"};
            }
        } else if constexpr (std::is_same_v<T, SetAccountDetail>) {
            if (!AccountId::parse(cmd.account_id)) {
                return {Status::INVALID_ARGUMENT, "invalid account id"};
            }
            if (!is_valid_detail_key(cmd.key)) {
                return {Status::INVALID_ARGUMENT, "invalid detail key"};
            }
            auto length = utf8_length(cmd.value);
            if (!length) {
                return {Status::INVALID_ARGUMENT, "detail value is not valid UTF-8"};
            }
            if (*length > MAX_DETAIL_VALUE_SIZE) {
                return {Status::VALUE_TOO_LARGE, "detail value exceeds " +
                        std::to_string(MAX_DETAIL_VALUE_SIZE) + " characters"};
            }
        } else if constexpr (std::is_same_v<T, TransferAsset>) {
            if (!AccountId::parse(cmd.src_account_id) || !AccountId::parse(cmd.dest_account_id)) {
                return {Status::INVALID_ARGUMENT, "invalid account id"};
            }
            if (cmd.amount == 0) {
                return {Status::INVALID_ARGUMENT, "transfer amount must be positive"};
            }
            if (cmd.description.size() > MAX_DESCRIPTION_SIZE) {
                return {Status::INVALID_ARGUMENT, "description too long"};
            }
        } else if constexpr (std::is_same_v<T, GrantPermission> ||
                             std::is_same_v<T, RevokePermission>) {
            if (!AccountId::parse(cmd.account_id)) {
                return {Status::INVALID_ARGUMENT, "invalid grantee account id"};
            }
        } else if constexpr (std::is_same_v<T, CreateAsset>) {
            if (!is_valid_account_name(cmd.asset_name) || !is_valid_domain_id(cmd.domain_id)) {
                return {Status::INVALID_ARGUMENT, "invalid asset id"};
            }
        } else if constexpr (std::is_same_v<T, AddAssetQuantity>) {
            if (cmd.amount == 0) {
                return {Status::INVALID_ARGUMENT, "quantity must be positive"};
            }
        }
        return {};
    }, command);
}

MemoryLedger::CommandResult MemoryLedger::execute(State& state,
                                                  const AccountRecord& creator,
                                                  const Command& command) const {
    const auto perms = permissions_of(state, creator);
    const auto creator_id = creator.id.to_string();

    return std::visit([&](const auto& cmd) -> CommandResult {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, CreateDomain>) {
            if (!(perms & role_permission::CAN_CREATE_DOMAIN)) {
                return {Status::PERMISSION_DENIED, "missing can_create_domain"};
            }
            if (!state.roles.contains(cmd.default_role)) {
                return {Status::NOT_FOUND, "role not found: " + cmd.default_role};
            }
            if (state.domains.contains(cmd.domain_id)) {
                return {Status::TRANSACTION_REJECTED, "domain already exists: " + cmd.domain_id};
            }
            state.domains[cmd.domain_id] = Domain{cmd.domain_id, cmd.default_role};
            return {};

        } else if constexpr (std::is_same_v<T, CreateAccount>) {
            if (!(perms & role_permission::CAN_CREATE_ACCOUNT)) {
                return {Status::PERMISSION_DENIED, "missing can_create_account"};
            }
            auto domain = state.domains.find(cmd.domain_id);
            if (domain == state.domains.end()) {
                return {Status::NOT_FOUND, "domain not found: " + cmd.domain_id};
            }
            AccountId id{cmd.account_name, cmd.domain_id};
            auto key = id.to_string();
            if (state.accounts.contains(key)) {
                return {Status::TRANSACTION_REJECTED, "account already exists: " + key};
            }
            AccountRecord record;
            record.id = std::move(id);
            record.public_key = cmd.public_key;
            record.role = domain->second.default_role;
            state.accounts[key] = std::move(record);
            return {};

        } else if constexpr (std::is_same_v<T, SetAccountDetail>) {
            auto target = state.accounts.find(cmd.account_id);
            if (target == state.accounts.end()) {
                return {Status::NOT_FOUND, "account not found: " + cmd.account_id};
            }
            const bool allowed =
                cmd.account_id == creator_id ||
                state.grants.contains(GrantKey{cmd.account_id, creator_id,
                                               GrantablePermission::CAN_SET_MY_ACCOUNT_DETAIL}) ||
                (perms & role_permission::CAN_SET_ALL_ACC_DETAIL);
            if (!allowed) {
                return {Status::PERMISSION_DENIED,
                        creator_id + " may not write details of " + cmd.account_id};
            }
            target->second.details[creator_id][cmd.key] = cmd.value;
            return {};

        } else if constexpr (std::is_same_v<T, TransferAsset>) {
            if (cmd.src_account_id != creator_id) {
                return {Status::PERMISSION_DENIED, "can only transfer from own account"};
            }
            auto src = state.accounts.find(cmd.src_account_id);
            auto dest = state.accounts.find(cmd.dest_account_id);
            if (src == state.accounts.end() || dest == state.accounts.end()) {
                return {Status::NOT_FOUND, "transfer account not found"};
            }
            if (src->second.id.domain != dest->second.id.domain) {
                return {Status::TRANSACTION_REJECTED, "cross-domain transfer"};
            }
            if (!state.assets.contains(cmd.asset_id)) {
                return {Status::NOT_FOUND, "asset not found: " + cmd.asset_id};
            }
            auto& src_balance = src->second.balances[cmd.asset_id];
            if (src_balance < cmd.amount) {
                return {Status::TRANSACTION_REJECTED, "insufficient balance"};
            }
            auto& dest_balance = dest->second.balances[cmd.asset_id];
            if (dest_balance > std::numeric_limits<amount_t>::max() - cmd.amount) {
                return {Status::TRANSACTION_REJECTED, "balance overflow"};
            }
            src_balance -= cmd.amount;
            dest_balance += cmd.amount;
            return {};

        } else if constexpr (std::is_same_v<T, GrantPermission>) {
            if (!state.accounts.contains(cmd.account_id)) {
                return {Status::NOT_FOUND, "grantee not found: " + cmd.account_id};
            }
            state.grants.insert(GrantKey{creator_id, cmd.account_id, cmd.permission});
            return {};

        } else if constexpr (std::is_same_v<T, RevokePermission>) {
            state.grants.erase(GrantKey{creator_id, cmd.account_id, cmd.permission});
            return {};

        } else if constexpr (std::is_same_v<T, CreateAsset>) {
            if (!(perms & role_permission::CAN_CREATE_ASSET)) {
                return {Status::PERMISSION_DENIED, "missing can_create_asset"};
            }
            if (!state.domains.contains(cmd.domain_id)) {
                return {Status::NOT_FOUND, "domain not found: " + cmd.domain_id};
            }
            auto asset_id = make_asset_id(cmd.asset_name, cmd.domain_id);
            if (state.assets.contains(asset_id)) {
                return {Status::TRANSACTION_REJECTED, "asset already exists: " + asset_id};
            }
            state.assets[asset_id] = AssetRecord{cmd.domain_id, cmd.precision};
            return {};

        } else if constexpr (std::is_same_v<T, AddAssetQuantity>) {
            if (!(perms & role_permission::CAN_ADD_ASSET_QTY)) {
                return {Status::PERMISSION_DENIED, "missing can_add_asset_qty"};
            }
            if (!state.assets.contains(cmd.asset_id)) {
                return {Status::NOT_FOUND, "asset not found: " + cmd.asset_id};
            }
            auto& balance = state.accounts.at(creator_id).balances[cmd.asset_id];
            if (balance > std::numeric_limits<amount_t>::max() - cmd.amount) {
                return {Status::TRANSACTION_REJECTED, "balance overflow"};
            }
            balance += cmd.amount;
            return {};
        }
    }, command);
}

// ============================================================================
// Queries
// ============================================================================

QueryResponse MemoryLedger::run_query(const AccountRecord& creator,
                                      const QueryPayload& payload) const {
    const auto perms = permissions_of(state_, creator);
    const auto creator_id = creator.id.to_string();

    auto visible = [&](const std::string& owner) {
        return owner == creator_id || (perms & role_permission::CAN_GET_ALL_ACC_DETAIL);
    };

    if (const auto* assets = std::get_if<GetAccountAssets>(&payload)) {
        auto it = state_.accounts.find(assets->account_id);
        if (it == state_.accounts.end()) {
            return QueryResponse::failure(Status::NOT_FOUND,
                                          "account not found: " + assets->account_id);
        }
        if (!visible(assets->account_id)) {
            return QueryResponse::failure(Status::QUERY_DENIED,
                                          creator_id + " may not read " + assets->account_id);
        }
        QueryResponse response;
        for (const auto& [asset_id, balance] : it->second.balances) {
            response.assets.push_back(AssetBalance{asset_id, assets->account_id, balance});
        }
        return response;
    }

    const auto& detail = std::get<GetAccountDetail>(payload);
    auto it = state_.accounts.find(detail.account_id);
    if (it == state_.accounts.end()) {
        return QueryResponse::failure(Status::NOT_FOUND,
                                      "account not found: " + detail.account_id);
    }
    if (!visible(detail.account_id)) {
        return QueryResponse::failure(Status::QUERY_DENIED,
                                      creator_id + " may not read " + detail.account_id);
    }

    QueryResponse response;
    for (const auto& [writer, entries] : it->second.details) {
        if (detail.writer && *detail.writer != writer) {
            continue;
        }
        for (const auto& [key, value] : entries) {
            if (detail.key && *detail.key != key) {
                continue;
            }
            response.details[writer][key] = value;
        }
    }
    return response;
}

}  // namespace coanneal
