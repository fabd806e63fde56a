#pragma once

#include "core/types.hh"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coanneal {

class MLDSAKeyPair;

// ============================================================================
// Permissions
// ============================================================================

// Permissions one account can hand to another
enum class GrantablePermission : std::uint8_t {
    CAN_SET_MY_ACCOUNT_DETAIL = 1,
};

[[nodiscard]] inline std::string_view grantable_permission_string(GrantablePermission p) {
    switch (p) {
        case GrantablePermission::CAN_SET_MY_ACCOUNT_DETAIL: return "can_set_my_account_detail";
    }
    return "unknown";
}

// ============================================================================
// Commands
// ============================================================================

enum class CommandType : std::uint8_t {
    CREATE_DOMAIN = 0x01,
    CREATE_ACCOUNT = 0x02,
    SET_ACCOUNT_DETAIL = 0x03,
    TRANSFER_ASSET = 0x04,
    GRANT_PERMISSION = 0x05,
    REVOKE_PERMISSION = 0x06,
    CREATE_ASSET = 0x07,
    ADD_ASSET_QUANTITY = 0x08,
};

[[nodiscard]] std::string_view command_type_string(CommandType type);

struct CreateDomain {
    std::string domain_id;
    std::string default_role;
};

struct CreateAccount {
    std::string account_name;
    std::string domain_id;
    mldsa_public_key_t public_key;
};

struct SetAccountDetail {
    std::string account_id;    // Owner of the detail
    std::string key;
    std::string value;
};

struct TransferAsset {
    std::string src_account_id;
    std::string dest_account_id;
    std::string asset_id;
    std::string description;
    amount_t amount = 0;
};

struct GrantPermission {
    std::string account_id;    // Grantee
    GrantablePermission permission = GrantablePermission::CAN_SET_MY_ACCOUNT_DETAIL;
};

struct RevokePermission {
    std::string account_id;    // Grantee
    GrantablePermission permission = GrantablePermission::CAN_SET_MY_ACCOUNT_DETAIL;
};

struct CreateAsset {
    std::string asset_name;
    std::string domain_id;
    std::uint8_t precision = 0;
};

struct AddAssetQuantity {
    std::string asset_id;
    amount_t amount = 0;
};

using Command = std::variant<
    CreateDomain,
    CreateAccount,
    SetAccountDetail,
    TransferAsset,
    GrantPermission,
    RevokePermission,
    CreateAsset,
    AddAssetQuantity>;

[[nodiscard]] CommandType command_type(const Command& command);

// Canonical encoding used for hashing and signing
void encode_command(std::vector<std::uint8_t>& out, const Command& command);

// ============================================================================
// Transaction
// ============================================================================

struct Transaction {
    std::string creator_account_id;
    std::uint64_t created_time_ms = 0;
    nonce_t nonce = 0;
    std::vector<Command> commands;

    [[nodiscard]] std::vector<std::uint8_t> payload() const;
    [[nodiscard]] hash_t hash() const;
};

struct SignedTransaction {
    Transaction tx;
    mldsa_public_key_t signer;
    mldsa_signature_t signature;

    [[nodiscard]] hash_t hash() const { return tx.hash(); }
    [[nodiscard]] bool verify() const;

    // Sign the transaction's payload hash; nullopt if the key cannot sign
    [[nodiscard]] static std::optional<SignedTransaction> sign(
        Transaction tx, const MLDSAKeyPair& keys);
};

}  // namespace coanneal
