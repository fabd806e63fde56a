#pragma once

#include "core/types.hh"
#include "crypto/signature.hh"
#include <optional>
#include <string>

namespace coanneal {

// ============================================================================
// Domain
// ============================================================================

struct Domain {
    std::string id;
    std::string default_role;
};

// ============================================================================
// Identity - a named party and its signing keys
// ============================================================================
//
// The private key never leaves this object: it is zeroed on destruction and the
// type is move-only. Everything the rest of the system needs to address the
// party (account id, public key) is available without touching the secret.

class Identity {
public:
    Identity(const Identity&) = delete;
    Identity& operator=(const Identity&) = delete;
    Identity(Identity&&) noexcept = default;
    Identity& operator=(Identity&&) noexcept = default;

    // New identity with a fresh ML-DSA-65 key pair
    [[nodiscard]] static std::optional<Identity> generate(AccountId account);

    // Restore from stored keys (fails if the halves do not match)
    [[nodiscard]] static std::optional<Identity> from_keys(
        AccountId account,
        const mldsa_public_key_t& pk,
        const mldsa_secret_key_t& sk);

    // Verification-only view of a remote party
    [[nodiscard]] static std::optional<Identity> from_public_key(
        AccountId account,
        const mldsa_public_key_t& pk);

    [[nodiscard]] const AccountId& account() const { return account_; }
    [[nodiscard]] std::string account_id() const { return account_.to_string(); }
    [[nodiscard]] const std::string& name() const { return account_.name; }
    [[nodiscard]] const std::string& domain() const { return account_.domain; }

    [[nodiscard]] const mldsa_public_key_t& public_key() const { return keys_.public_key(); }
    [[nodiscard]] const MLDSAKeyPair& keys() const { return keys_; }
    [[nodiscard]] bool can_sign() const { return keys_.has_secret_key(); }

private:
    Identity(AccountId account, MLDSAKeyPair keys);

    AccountId account_;
    MLDSAKeyPair keys_;
};

}  // namespace coanneal
