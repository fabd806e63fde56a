#pragma once

#include "ledger/client.hh"
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace coanneal {

// ============================================================================
// Permission Registry - can_set_my_account_detail grants
// ============================================================================
//
// The cache only reflects writes made through this registry. An entry is
// dropped before a grant/revoke is submitted and set again only once the
// ledger committed it, so a failed or timed-out write leaves it unknown.

class PermissionRegistry {
public:
    explicit PermissionRegistry(LedgerClient& client);

    // Allow grantee to write details into grantor's account. Idempotent.
    SubmitResult grant(const Identity& grantor, const AccountId& grantee);

    // Withdraw a grant. Idempotent.
    SubmitResult revoke(const Identity& grantor, const AccountId& grantee);

    // Last committed state observed by this registry, nullopt when unknown
    [[nodiscard]] std::optional<bool> cached(const AccountId& grantor,
                                             const AccountId& grantee) const;

    void clear_cache();

private:
    using CacheKey = std::pair<std::string, std::string>;

    LedgerClient& client_;
    std::map<CacheKey, bool> cache_;
    mutable std::mutex mutex_;

    SubmitResult write(const Identity& grantor, const AccountId& grantee, bool granted);
};

}  // namespace coanneal
