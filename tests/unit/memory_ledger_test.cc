#include "unit/fixtures.hh"
#include <thread>

namespace coanneal {
namespace {

using test::make_identity;

class MemoryLedgerTest : public test::LedgerFixture {
protected:
    SignedTransaction sign(const Identity& who, std::vector<Command> commands,
                           std::uint64_t created_ms = now_ms()) {
        Transaction tx{who.account_id(), created_ms, nonce_++, std::move(commands)};
        auto signed_tx = SignedTransaction::sign(std::move(tx), who.keys());
        if (!signed_tx) {
            throw std::runtime_error("signing failed");
        }
        return *signed_tx;
    }

    // Submit and force commit, returning the final status
    TxStatus settle(const SignedTransaction& tx) {
        auto submitted = ledger->submit(tx);
        if (submitted.state == TxState::REJECTED) {
            return submitted;
        }
        ledger->flush();
        return ledger->status(tx.hash());
    }

    QueryResponse query(const Identity& who, QueryPayload payload) {
        Query q{who.account_id(), now_ms(), nonce_++, std::move(payload)};
        auto signed_query = SignedQuery::sign(std::move(q), who.keys());
        if (!signed_query) {
            throw std::runtime_error("signing failed");
        }
        return ledger->query(*signed_query);
    }

    QueryResponse details(const Identity& who, const std::string& owner) {
        return query(who, GetAccountDetail{owner, std::nullopt, std::nullopt});
    }

    nonce_t nonce_ = 1;
};

// ============================================================================
// Genesis and Submission
// ============================================================================

TEST_F(MemoryLedgerTest, GenesisOnlyOnce) {
    EXPECT_FALSE(ledger->genesis("test", admin->account(), admin->public_key()));
    EXPECT_TRUE(ledger->account_exists("admin@test"));
}

TEST_F(MemoryLedgerTest, SubmitIsPendingUntilCommitted) {
    auto tx = sign(*admin, {SetAccountDetail{"admin@test", "k", "v"}});

    auto submitted = ledger->submit(tx);
    EXPECT_EQ(submitted.state, TxState::PENDING);
    EXPECT_FALSE(submitted.is_final());

    auto final_status = ledger->status(tx.hash());
    EXPECT_EQ(final_status.state, TxState::COMMITTED);
    EXPECT_EQ(ledger->committed_count(), 1);
}

TEST_F(MemoryLedgerTest, UnknownHash) {
    hash_t unknown{};
    EXPECT_EQ(ledger->status(unknown).state, TxState::UNKNOWN);
}

TEST_F(MemoryLedgerTest, ReplayRejected) {
    auto tx = sign(*admin, {SetAccountDetail{"admin@test", "k", "v"}});
    EXPECT_EQ(settle(tx).state, TxState::COMMITTED);

    auto replay = ledger->submit(tx);
    EXPECT_EQ(replay.state, TxState::REJECTED);
    EXPECT_EQ(replay.error, Status::TRANSACTION_REJECTED);

    // The original stays committed
    EXPECT_EQ(ledger->status(tx.hash()).state, TxState::COMMITTED);
}

TEST_F(MemoryLedgerTest, EmptyTransactionRejected) {
    auto tx = sign(*admin, {});
    auto status = ledger->submit(tx);
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::TRANSACTION_REJECTED);
}

TEST_F(MemoryLedgerTest, StaleCreatedTimeRejected) {
    auto tx = sign(*admin, {SetAccountDetail{"admin@test", "k", "v"}},
                   now_ms() - 48ULL * 60 * 60 * 1000);
    auto status = ledger->submit(tx);
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::TRANSACTION_REJECTED);
}

TEST_F(MemoryLedgerTest, ForgedSignatureRejected) {
    auto other = make_identity("mallory");
    auto tx = sign(*admin, {SetAccountDetail{"admin@test", "k", "v"}});
    tx.signer = other.public_key();

    auto status = ledger->submit(tx);
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::INVALID_SIGNATURE);
}

TEST_F(MemoryLedgerTest, UnregisteredSignatoryRejected) {
    add_account("alice");
    auto impostor = make_identity("alice");    // Same account id, different key

    auto tx = sign(impostor, {SetAccountDetail{"alice@test", "k", "v"}});
    auto status = settle(tx);
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::INVALID_SIGNATURE);
}

TEST_F(MemoryLedgerTest, UnknownCreatorRejected) {
    auto ghost = make_identity("ghost");
    auto status = settle(sign(ghost, {SetAccountDetail{"ghost@test", "k", "v"}}));
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::INVALID_SIGNATURE);
}

// ============================================================================
// Detail Rules
// ============================================================================

TEST_F(MemoryLedgerTest, ValueTooLargeFailsStateless) {
    auto alice = add_account("alice");
    std::string big(MAX_DETAIL_VALUE_SIZE + 1, 'x');
    auto status = ledger->submit(sign(alice, {SetAccountDetail{"alice@test", "k", big}}));
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::VALUE_TOO_LARGE);

    std::string fits(MAX_DETAIL_VALUE_SIZE, 'x');
    EXPECT_EQ(settle(sign(alice, {SetAccountDetail{"alice@test", "k", fits}})).state,
              TxState::COMMITTED);
}

TEST_F(MemoryLedgerTest, ValueLimitCountsCharacters) {
    auto alice = add_account("alice");

    std::string two_byte;
    for (std::size_t i = 0; i < MAX_DETAIL_VALUE_SIZE; ++i) {
        two_byte += "\xC3\xA9";
    }
    EXPECT_EQ(settle(sign(alice, {SetAccountDetail{"alice@test", "k", two_byte}})).state,
              TxState::COMMITTED);

    two_byte += "\xC3\xA9";
    auto status = ledger->submit(sign(alice, {SetAccountDetail{"alice@test", "k", two_byte}}));
    EXPECT_EQ(status.error, Status::VALUE_TOO_LARGE);
}

TEST_F(MemoryLedgerTest, MalformedUtf8FailsStateless) {
    auto alice = add_account("alice");
    auto status = ledger->submit(
        sign(alice, {SetAccountDetail{"alice@test", "k", "\xFF\xFE"}}));
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::INVALID_ARGUMENT);
}

TEST_F(MemoryLedgerTest, InvalidKeyFailsStateless) {
    auto alice = add_account("alice");
    auto status = ledger->submit(sign(alice, {SetAccountDetail{"alice@test", "bad key", "v"}}));
    EXPECT_EQ(status.error, Status::INVALID_ARGUMENT);
}

TEST_F(MemoryLedgerTest, WriteIntoOtherAccountNeedsGrant) {
    auto alice = add_account("alice");
    auto bob = add_account("bob");

    auto denied = settle(sign(bob, {SetAccountDetail{"alice@test", "k", "v"}}));
    EXPECT_EQ(denied.state, TxState::REJECTED);
    EXPECT_EQ(denied.error, Status::PERMISSION_DENIED);

    EXPECT_EQ(settle(sign(alice, {GrantPermission{"bob@test"}})).state, TxState::COMMITTED);
    EXPECT_TRUE(ledger->has_grant("alice@test", "bob@test",
                                  GrantablePermission::CAN_SET_MY_ACCOUNT_DETAIL));
    EXPECT_EQ(settle(sign(bob, {SetAccountDetail{"alice@test", "k", "v"}})).state,
              TxState::COMMITTED);

    EXPECT_EQ(settle(sign(alice, {RevokePermission{"bob@test"}})).state, TxState::COMMITTED);
    auto revoked = settle(sign(bob, {SetAccountDetail{"alice@test", "k", "w"}}));
    EXPECT_EQ(revoked.error, Status::PERMISSION_DENIED);
}

TEST_F(MemoryLedgerTest, GrantToUnknownAccount) {
    auto alice = add_account("alice");
    auto status = settle(sign(alice, {GrantPermission{"nobody@test"}}));
    EXPECT_EQ(status.error, Status::NOT_FOUND);
}

TEST_F(MemoryLedgerTest, AdminRoleWritesAnywhere) {
    add_account("alice");
    EXPECT_EQ(settle(sign(*admin, {SetAccountDetail{"alice@test", "note", "hi"}})).state,
              TxState::COMMITTED);
}

TEST_F(MemoryLedgerTest, WritersKeepDistinctValues) {
    auto alice = add_account("alice");
    auto bob = add_account("bob");
    ASSERT_EQ(settle(sign(alice, {GrantPermission{"bob@test"}})).state, TxState::COMMITTED);

    ASSERT_EQ(settle(sign(alice, {SetAccountDetail{"alice@test", "cost", "1"}})).state,
              TxState::COMMITTED);
    ASSERT_EQ(settle(sign(bob, {SetAccountDetail{"alice@test", "cost", "2"}})).state,
              TxState::COMMITTED);

    auto r = details(alice, "alice@test");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.details["alice@test"]["cost"], "1");
    EXPECT_EQ(r.details["bob@test"]["cost"], "2");
}

TEST_F(MemoryLedgerTest, OverwriteKeepsLatest) {
    auto alice = add_account("alice");
    settle(sign(alice, {SetAccountDetail{"alice@test", "k", "old"}}));
    settle(sign(alice, {SetAccountDetail{"alice@test", "k", "new"}}));

    auto r = details(alice, "alice@test");
    EXPECT_EQ(r.details["alice@test"]["k"], "new");
}

TEST_F(MemoryLedgerTest, MultiCommandTransactionIsAtomic) {
    auto alice = add_account("alice");
    add_account("bob");

    // Second command fails: bob never granted alice
    auto status = settle(sign(alice, {
        SetAccountDetail{"alice@test", "first", "1"},
        SetAccountDetail{"bob@test", "second", "2"},
    }));
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::PERMISSION_DENIED);

    auto r = details(alice, "alice@test");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.details.empty());
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(MemoryLedgerTest, QueryFilters) {
    auto alice = add_account("alice");
    auto bob = add_account("bob");
    settle(sign(alice, {GrantPermission{"bob@test"}}));
    settle(sign(alice, {SetAccountDetail{"alice@test", "a", "1"},
                        SetAccountDetail{"alice@test", "b", "2"}}));
    settle(sign(bob, {SetAccountDetail{"alice@test", "a", "3"}}));

    auto by_key = query(alice, GetAccountDetail{"alice@test", std::nullopt, std::string("a")});
    ASSERT_TRUE(by_key.ok());
    EXPECT_EQ(by_key.details.size(), 2);
    EXPECT_EQ(by_key.details["alice@test"].size(), 1);

    auto by_writer = query(alice, GetAccountDetail{"alice@test", std::string("bob@test"),
                                                   std::nullopt});
    ASSERT_TRUE(by_writer.ok());
    ASSERT_EQ(by_writer.details.size(), 1);
    EXPECT_EQ(by_writer.details["bob@test"]["a"], "3");

    auto none = query(alice, GetAccountDetail{"alice@test", std::string("bob@test"),
                                              std::string("zzz")});
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.details.empty());
}

TEST_F(MemoryLedgerTest, ReadingOtherAccountDenied) {
    add_account("alice");
    auto bob = add_account("bob");

    auto r = details(bob, "alice@test");
    EXPECT_EQ(r.status, Status::QUERY_DENIED);

    auto as_admin = details(*admin, "alice@test");
    EXPECT_TRUE(as_admin.ok());
}

TEST_F(MemoryLedgerTest, QueryUnknownAccount) {
    auto r = details(*admin, "nobody@test");
    EXPECT_EQ(r.status, Status::NOT_FOUND);
}

TEST_F(MemoryLedgerTest, QueryWithForeignKeyDenied) {
    add_account("alice");
    auto impostor = make_identity("alice");
    auto r = details(impostor, "alice@test");
    EXPECT_EQ(r.status, Status::QUERY_DENIED);
}

// ============================================================================
// Assets
// ============================================================================

TEST_F(MemoryLedgerTest, AssetLifecycle) {
    auto alice = add_account("alice");
    ASSERT_EQ(settle(sign(*admin, {CreateAsset{"coin", "test", 0},
                                   AddAssetQuantity{"coin#test", 100}})).state,
              TxState::COMMITTED);

    EXPECT_EQ(settle(sign(*admin, {TransferAsset{"admin@test", "alice@test", "coin#test",
                                                 "pay", 40}})).state,
              TxState::COMMITTED);

    auto overdraft = settle(sign(alice, {TransferAsset{"alice@test", "admin@test", "coin#test",
                                                       "", 41}}));
    EXPECT_EQ(overdraft.state, TxState::REJECTED);
    EXPECT_EQ(overdraft.error, Status::TRANSACTION_REJECTED);

    auto r = query(alice, GetAccountAssets{"alice@test"});
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.assets.size(), 1);
    EXPECT_EQ(r.assets[0].asset_id, "coin#test");
    EXPECT_EQ(r.assets[0].balance, 40);
}

TEST_F(MemoryLedgerTest, TransferAcrossDomainsRejected) {
    ASSERT_EQ(settle(sign(*admin, {CreateDomain{"other", "user"},
                                   CreateAsset{"coin", "test", 0},
                                   AddAssetQuantity{"coin#test", 10}})).state,
              TxState::COMMITTED);
    auto carol = make_identity("carol", "other");
    ASSERT_EQ(settle(sign(*admin, {CreateAccount{"carol", "other", carol.public_key()}})).state,
              TxState::COMMITTED);

    auto status = settle(sign(*admin, {TransferAsset{"admin@test", "carol@other", "coin#test",
                                                     "", 1}}));
    EXPECT_EQ(status.state, TxState::REJECTED);
    EXPECT_EQ(status.error, Status::TRANSACTION_REJECTED);
}

TEST_F(MemoryLedgerTest, UserRoleCannotAdminister) {
    auto alice = add_account("alice");
    auto status = settle(sign(alice, {CreateAsset{"coin", "test", 0}}));
    EXPECT_EQ(status.error, Status::PERMISSION_DENIED);

    auto bob = make_identity("bob");
    status = settle(sign(alice, {CreateAccount{"bob", "test", bob.public_key()}}));
    EXPECT_EQ(status.error, Status::PERMISSION_DENIED);
}

TEST_F(MemoryLedgerTest, DuplicateAccountRejected) {
    auto alice = add_account("alice");
    auto status = settle(sign(*admin, {CreateAccount{"alice", "test", alice.public_key()}}));
    EXPECT_EQ(status.error, Status::TRANSACTION_REJECTED);
}

// ============================================================================
// Commit Latency
// ============================================================================

TEST_F(MemoryLedgerTest, WritesBecomeVisibleAfterLatency) {
    auto alice = add_account("alice");
    ledger->set_commit_latency(std::chrono::milliseconds(100));

    auto tx = sign(alice, {SetAccountDetail{"alice@test", "k", "v"}});
    EXPECT_EQ(ledger->submit(tx).state, TxState::PENDING);

    // Not visible yet
    EXPECT_EQ(ledger->status(tx.hash()).state, TxState::PENDING);
    EXPECT_TRUE(details(alice, "alice@test").details.empty());
    EXPECT_EQ(ledger->pending_count(), 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    EXPECT_EQ(ledger->status(tx.hash()).state, TxState::COMMITTED);
    EXPECT_EQ(details(alice, "alice@test").details["alice@test"]["k"], "v");
}

TEST_F(MemoryLedgerTest, CommitOrderFollowsSubmission) {
    auto alice = add_account("alice");
    ledger->set_commit_latency(std::chrono::milliseconds(50));

    ledger->submit(sign(alice, {SetAccountDetail{"alice@test", "k", "first"}}));
    ledger->submit(sign(alice, {SetAccountDetail{"alice@test", "k", "second"}}));
    ledger->flush();

    EXPECT_EQ(details(alice, "alice@test").details["alice@test"]["k"], "second");
}

}  // namespace
}  // namespace coanneal
