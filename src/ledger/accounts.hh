#pragma once

#include "ledger/client.hh"
#include <vector>

namespace coanneal {

// ============================================================================
// Account Service - domain, account and asset administration
// ============================================================================
//
// Thin command builders over LedgerClient. The acting identity needs the
// matching role permission (can_create_domain, can_create_account, ...).

class AccountService {
public:
    explicit AccountService(LedgerClient& client);

    SubmitResult create_domain(const Identity& admin, const Domain& domain);

    // Registers the identity's public key under its account id
    SubmitResult create_account(const Identity& admin, const Identity& account);
    SubmitResult create_account(const Identity& admin, const AccountId& account,
                                const mldsa_public_key_t& public_key);

    SubmitResult create_asset(const Identity& admin, const std::string& asset_name,
                              const std::string& domain_id, std::uint8_t precision = 0);

    // Mints quantity into the actor's own account
    SubmitResult add_asset_quantity(const Identity& actor, const std::string& asset_id,
                                    amount_t amount);

    SubmitResult transfer(const Identity& from, const AccountId& to,
                          const std::string& asset_id, amount_t amount,
                          std::string description = {});

    struct BalancesResult {
        Status status = Status::OK;
        std::string reason;
        std::vector<AssetBalance> balances;

        [[nodiscard]] bool ok() const { return status == Status::OK; }
    };

    [[nodiscard]] BalancesResult balances(const Identity& reader, const AccountId& owner);

private:
    LedgerClient& client_;
};

}  // namespace coanneal
