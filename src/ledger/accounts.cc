#include "accounts.hh"
#include "core/logging.hh"

namespace coanneal {

namespace {

void log_outcome(const char* what, const std::string& subject, const SubmitResult& result) {
    if (result.ok()) {
        log::accounts.info() << what << " " << subject;
    } else {
        log::accounts.warn() << what << " " << subject << " failed: "
                             << status_string(result.status) << " " << result.reason;
    }
}

}  // namespace

AccountService::AccountService(LedgerClient& client)
    : client_(client) {}

SubmitResult AccountService::create_domain(const Identity& admin, const Domain& domain) {
    auto result = client_.submit({CreateDomain{domain.id, domain.default_role}}, admin);
    log_outcome("Create domain", domain.id, result);
    return result;
}

SubmitResult AccountService::create_account(const Identity& admin, const Identity& account) {
    return create_account(admin, account.account(), account.public_key());
}

SubmitResult AccountService::create_account(const Identity& admin, const AccountId& account,
                                            const mldsa_public_key_t& public_key) {
    auto result = client_.submit({CreateAccount{account.name, account.domain, public_key}}, admin);
    log_outcome("Create account", account.to_string(), result);
    return result;
}

SubmitResult AccountService::create_asset(const Identity& admin, const std::string& asset_name,
                                          const std::string& domain_id, std::uint8_t precision) {
    auto result = client_.submit({CreateAsset{asset_name, domain_id, precision}}, admin);
    log_outcome("Create asset", make_asset_id(asset_name, domain_id), result);
    return result;
}

SubmitResult AccountService::add_asset_quantity(const Identity& actor, const std::string& asset_id,
                                                amount_t amount) {
    auto result = client_.submit({AddAssetQuantity{asset_id, amount}}, actor);
    log_outcome("Add quantity of", asset_id, result);
    return result;
}

SubmitResult AccountService::transfer(const Identity& from, const AccountId& to,
                                      const std::string& asset_id, amount_t amount,
                                      std::string description) {
    TransferAsset cmd{from.account_id(), to.to_string(), asset_id, std::move(description), amount};
    auto result = client_.submit({std::move(cmd)}, from);
    log_outcome("Transfer", asset_id + " " + from.account_id() + " -> " + to.to_string(), result);
    return result;
}

AccountService::BalancesResult AccountService::balances(const Identity& reader,
                                                        const AccountId& owner) {
    auto response = client_.query(GetAccountAssets{owner.to_string()}, reader);
    BalancesResult result;
    result.status = response.status;
    result.reason = std::move(response.reason);
    result.balances = std::move(response.assets);
    return result;
}

}  // namespace coanneal
