#include "transaction.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include "core/logging.hh"
#include <type_traits>

namespace coanneal {

namespace {

constexpr std::uint8_t TX_DOMAIN_TAG = 0x54;  // 'T'

}  // namespace

std::string_view command_type_string(CommandType type) {
    switch (type) {
        case CommandType::CREATE_DOMAIN: return "CreateDomain";
        case CommandType::CREATE_ACCOUNT: return "CreateAccount";
        case CommandType::SET_ACCOUNT_DETAIL: return "SetAccountDetail";
        case CommandType::TRANSFER_ASSET: return "TransferAsset";
        case CommandType::GRANT_PERMISSION: return "GrantPermission";
        case CommandType::REVOKE_PERMISSION: return "RevokePermission";
        case CommandType::CREATE_ASSET: return "CreateAsset";
        case CommandType::ADD_ASSET_QUANTITY: return "AddAssetQuantity";
    }
    return "Unknown";
}

CommandType command_type(const Command& command) {
    return std::visit([](const auto& cmd) -> CommandType {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CreateDomain>) return CommandType::CREATE_DOMAIN;
        else if constexpr (std::is_same_v<T, CreateAccount>) return CommandType::CREATE_ACCOUNT;
        else if constexpr (std::is_same_v<T, SetAccountDetail>) return CommandType::SET_ACCOUNT_DETAIL;
        else if constexpr (std::is_same_v<T, TransferAsset>) return CommandType::TRANSFER_ASSET;
        else if constexpr (std::is_same_v<T, GrantPermission>) return CommandType::GRANT_PERMISSION;
        else if constexpr (std::is_same_v<T, RevokePermission>) return CommandType::REVOKE_PERMISSION;
        else if constexpr (std::is_same_v<T, CreateAsset>) return CommandType::CREATE_ASSET;
        else return CommandType::ADD_ASSET_QUANTITY;
    }, command);
}

void encode_command(std::vector<std::uint8_t>& out, const Command& command) {
    append_u8(out, static_cast<std::uint8_t>(command_type(command)));

    std::visit([&out](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CreateDomain>) {
            append_string(out, cmd.domain_id);
            append_string(out, cmd.default_role);
        } else if constexpr (std::is_same_v<T, CreateAccount>) {
            append_string(out, cmd.account_name);
            append_string(out, cmd.domain_id);
            append_bytes(out, cmd.public_key);
        } else if constexpr (std::is_same_v<T, SetAccountDetail>) {
            append_string(out, cmd.account_id);
            append_string(out, cmd.key);
            append_string(out, cmd.value);
        } else if constexpr (std::is_same_v<T, TransferAsset>) {
            append_string(out, cmd.src_account_id);
            append_string(out, cmd.dest_account_id);
            append_string(out, cmd.asset_id);
            append_string(out, cmd.description);
            append_u64(out, cmd.amount);
        } else if constexpr (std::is_same_v<T, GrantPermission> ||
                             std::is_same_v<T, RevokePermission>) {
            append_string(out, cmd.account_id);
            append_u8(out, static_cast<std::uint8_t>(cmd.permission));
        } else if constexpr (std::is_same_v<T, CreateAsset>) {
            append_string(out, cmd.asset_name);
            append_string(out, cmd.domain_id);
            append_u8(out, cmd.precision);
        } else if constexpr (std::is_same_v<T, AddAssetQuantity>) {
            append_string(out, cmd.asset_id);
            append_u64(out, cmd.amount);
        }
    }, command);
}

// ============================================================================
// Transaction Implementation
// ============================================================================

std::vector<std::uint8_t> Transaction::payload() const {
    std::vector<std::uint8_t> out;
    append_u8(out, TX_DOMAIN_TAG);
    append_string(out, creator_account_id);
    append_u64(out, created_time_ms);
    append_u64(out, nonce);
    append_u32(out, static_cast<std::uint32_t>(commands.size()));
    for (const auto& command : commands) {
        encode_command(out, command);
    }
    return out;
}

hash_t Transaction::hash() const {
    return sha3_256(payload());
}

bool SignedTransaction::verify() const {
    auto h = hash();
    return mldsa_verify(signer, h, signature);
}

std::optional<SignedTransaction> SignedTransaction::sign(
    Transaction tx, const MLDSAKeyPair& keys) {
    auto h = tx.hash();
    auto sig = keys.sign(h);
    if (!sig) {
        log::ledger.error() << "Cannot sign transaction of " << tx.creator_account_id;
        return std::nullopt;
    }
    return SignedTransaction{std::move(tx), keys.public_key(), *sig};
}

}  // namespace coanneal
