#pragma once

#include <gtest/gtest.h>
#include "ledger/memory_ledger.hh"
#include "ledger/client.hh"
#include "ledger/accounts.hh"
#include <memory>
#include <optional>
#include <stdexcept>

namespace coanneal::test {

inline constexpr const char* TEST_DOMAIN = "test";

inline Identity make_identity(const std::string& name, const std::string& domain = TEST_DOMAIN) {
    auto id = Identity::generate(AccountId{name, domain});
    if (!id) {
        throw std::runtime_error("cannot generate identity " + name);
    }
    return std::move(*id);
}

inline ClientConfig fast_client_config() {
    return ClientConfig{std::chrono::milliseconds(1), std::chrono::milliseconds(2000)};
}

// Memory ledger with genesis applied and an admin able to create accounts
class LedgerFixture : public ::testing::Test {
protected:
    void SetUp() override {
        ledger = std::make_shared<MemoryLedger>(ledger_config());
        admin.emplace(make_identity("admin"));
        ASSERT_TRUE(ledger->genesis(TEST_DOMAIN, admin->account(), admin->public_key()));
        client = std::make_unique<LedgerClient>(ledger, fast_client_config());
        accounts = std::make_unique<AccountService>(*client);
    }

    virtual MemoryLedgerConfig ledger_config() const { return MemoryLedgerConfig{}; }

    Identity add_account(const std::string& name) {
        auto id = make_identity(name);
        auto result = accounts->create_account(*admin, id);
        EXPECT_TRUE(result.ok()) << status_string(result.status) << " " << result.reason;
        return id;
    }

    std::shared_ptr<MemoryLedger> ledger;
    std::optional<Identity> admin;
    std::unique_ptr<LedgerClient> client;
    std::unique_ptr<AccountService> accounts;
};

}  // namespace coanneal::test
