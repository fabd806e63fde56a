#include "permission_registry.hh"
#include "core/logging.hh"

namespace coanneal {

PermissionRegistry::PermissionRegistry(LedgerClient& client)
    : client_(client) {}

SubmitResult PermissionRegistry::grant(const Identity& grantor, const AccountId& grantee) {
    return write(grantor, grantee, true);
}

SubmitResult PermissionRegistry::revoke(const Identity& grantor, const AccountId& grantee) {
    return write(grantor, grantee, false);
}

SubmitResult PermissionRegistry::write(const Identity& grantor, const AccountId& grantee,
                                       bool granted) {
    CacheKey key{grantor.account_id(), grantee.to_string()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.erase(key);
    }

    constexpr auto permission = GrantablePermission::CAN_SET_MY_ACCOUNT_DETAIL;
    Command command = granted
        ? Command{GrantPermission{key.second, permission}}
        : Command{RevokePermission{key.second, permission}};

    auto result = client_.submit({std::move(command)}, grantor);
    if (!result.ok()) {
        log::permission.warn() << (granted ? "Grant " : "Revoke ") << key.first << " -> "
                               << key.second << " failed: " << status_string(result.status)
                               << " " << result.reason;
        return result;
    }

    log::permission.info() << (granted ? "Granted " : "Revoked ")
                           << grantable_permission_string(permission) << " "
                           << key.first << " -> " << key.second;

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = granted;
    return result;
}

std::optional<bool> PermissionRegistry::cached(const AccountId& grantor,
                                               const AccountId& grantee) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(CacheKey{grantor.to_string(), grantee.to_string()});
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PermissionRegistry::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

}  // namespace coanneal
