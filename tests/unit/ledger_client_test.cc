#include "unit/fixtures.hh"
#include <set>
#include <thread>

namespace coanneal {
namespace {

using test::make_identity;

// Ledger that never finalizes anything
class StuckLedger : public Ledger {
public:
    TxStatus submit(const SignedTransaction&) override {
        ++submitted;
        return TxStatus{TxState::PENDING, Status::OK, {}};
    }
    TxStatus status(const hash_t&) override {
        ++polled;
        return TxStatus{TxState::PENDING, Status::OK, {}};
    }
    QueryResponse query(const SignedQuery&) override {
        return QueryResponse::failure(Status::NOT_FOUND, "empty");
    }

    std::atomic<int> submitted{0};
    std::atomic<int> polled{0};
};

class LedgerClientTest : public test::LedgerFixture {};

TEST_F(LedgerClientTest, SubmitWaitsForCommit) {
    auto result = client->submit({SetAccountDetail{"admin@test", "k", "v"}}, *admin);
    EXPECT_TRUE(result.ok()) << result.reason;
    EXPECT_EQ(ledger->status(result.tx_hash).state, TxState::COMMITTED);
}

TEST_F(LedgerClientTest, SubmitReportsRejection) {
    auto alice = add_account("alice");
    auto result = client->submit({SetAccountDetail{"admin@test", "k", "v"}}, alice);
    EXPECT_EQ(result.status, Status::PERMISSION_DENIED);
    EXPECT_FALSE(result.reason.empty());
}

TEST_F(LedgerClientTest, SubmitWithoutSecretKey) {
    auto view = Identity::from_public_key(admin->account(), admin->public_key());
    ASSERT_TRUE(view.has_value());

    auto result = client->submit({SetAccountDetail{"admin@test", "k", "v"}}, *view);
    EXPECT_EQ(result.status, Status::INVALID_SIGNATURE);
    EXPECT_EQ(ledger->committed_count(), 0);
}

TEST_F(LedgerClientTest, IdenticalCommandsAreNotReplays) {
    for (int i = 0; i < 3; ++i) {
        auto result = client->submit({SetAccountDetail{"admin@test", "k", "same"}}, *admin);
        EXPECT_TRUE(result.ok()) << result.reason;
    }
    EXPECT_EQ(ledger->committed_count(), 3);
}

TEST_F(LedgerClientTest, NoncesIncrease) {
    std::set<nonce_t> seen;
    nonce_t previous = client->next_nonce();
    for (int i = 0; i < 100; ++i) {
        auto n = client->next_nonce();
        EXPECT_GT(n, previous);
        previous = n;
        seen.insert(n);
    }
    EXPECT_EQ(seen.size(), 100);
}

TEST_F(LedgerClientTest, QueryOwnDetails) {
    ASSERT_TRUE(client->submit({SetAccountDetail{"admin@test", "k", "v"}}, *admin).ok());

    auto response = client->query(GetAccountDetail{"admin@test", std::nullopt, std::nullopt},
                                  *admin);
    ASSERT_TRUE(response.ok());
    EXPECT_EQ(response.details["admin@test"]["k"], "v");
}

TEST_F(LedgerClientTest, QueryWithoutSecretKey) {
    auto view = Identity::from_public_key(admin->account(), admin->public_key());
    ASSERT_TRUE(view.has_value());

    auto response = client->query(GetAccountAssets{"admin@test"}, *view);
    EXPECT_EQ(response.status, Status::INVALID_SIGNATURE);
}

TEST_F(LedgerClientTest, WaitsThroughCommitLatency) {
    ledger->set_commit_latency(std::chrono::milliseconds(30));

    auto started = std::chrono::steady_clock::now();
    auto result = client->submit({SetAccountDetail{"admin@test", "k", "v"}}, *admin);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.ok()) << result.reason;
    EXPECT_GE(elapsed, std::chrono::milliseconds(30));
}

TEST(LedgerClientTimeoutTest, CommitTimeout) {
    auto stuck = std::make_shared<StuckLedger>();
    LedgerClient client(stuck, ClientConfig{std::chrono::milliseconds(5),
                                            std::chrono::milliseconds(50)});
    auto signer = make_identity("alice");

    auto result = client.submit({SetAccountDetail{"alice@test", "k", "v"}}, signer);
    EXPECT_EQ(result.status, Status::TIMEOUT);
    EXPECT_EQ(stuck->submitted.load(), 1);
    EXPECT_GT(stuck->polled.load(), 1);
}

}  // namespace
}  // namespace coanneal
