#include "identity.hh"
#include "core/logging.hh"

namespace coanneal {

Identity::Identity(AccountId account, MLDSAKeyPair keys)
    : account_(std::move(account))
    , keys_(std::move(keys)) {}

std::optional<Identity> Identity::generate(AccountId account) {
    if (!account.is_valid()) {
        log::core.warn() << "Invalid account id: " << account.to_string();
        return std::nullopt;
    }

    auto keys = MLDSAKeyPair::generate();
    if (!keys) {
        return std::nullopt;
    }

    COANNEAL_LOG_DEBUG(log::core) << "Generated identity " << account.to_string()
                                  << " key=" << keys->fingerprint();
    return Identity(std::move(account), std::move(*keys));
}

std::optional<Identity> Identity::from_keys(
    AccountId account,
    const mldsa_public_key_t& pk,
    const mldsa_secret_key_t& sk) {
    if (!account.is_valid()) {
        log::core.warn() << "Invalid account id: " << account.to_string();
        return std::nullopt;
    }

    auto keys = MLDSAKeyPair::from_keys(pk, sk);
    if (!keys) {
        return std::nullopt;
    }
    return Identity(std::move(account), std::move(*keys));
}

std::optional<Identity> Identity::from_public_key(
    AccountId account,
    const mldsa_public_key_t& pk) {
    if (!account.is_valid()) {
        return std::nullopt;
    }
    return Identity(std::move(account), MLDSAKeyPair::from_public_key(pk));
}

}  // namespace coanneal
