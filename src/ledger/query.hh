#pragma once

#include "core/types.hh"
#include "core/status.hh"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coanneal {

class MLDSAKeyPair;

// ============================================================================
// Queries
// ============================================================================

enum class QueryType : std::uint8_t {
    GET_ACCOUNT_ASSETS = 0x01,
    GET_ACCOUNT_DETAIL = 0x02,
};

struct GetAccountAssets {
    std::string account_id;
};

struct GetAccountDetail {
    std::string account_id;                 // Owner
    std::optional<std::string> writer;      // Filter by writer account id
    std::optional<std::string> key;         // Filter by detail key
};

using QueryPayload = std::variant<GetAccountAssets, GetAccountDetail>;

[[nodiscard]] QueryType query_type(const QueryPayload& payload);

struct Query {
    std::string creator_account_id;
    std::uint64_t created_time_ms = 0;
    nonce_t counter = 0;
    QueryPayload payload;

    [[nodiscard]] std::vector<std::uint8_t> encode() const;
    [[nodiscard]] hash_t hash() const;
};

struct SignedQuery {
    Query query;
    mldsa_public_key_t signer;
    mldsa_signature_t signature;

    [[nodiscard]] bool verify() const;

    [[nodiscard]] static std::optional<SignedQuery> sign(Query query, const MLDSAKeyPair& keys);
};

// ============================================================================
// Query Results
// ============================================================================

// writer account id -> (key -> value)
using DetailMap = std::map<std::string, std::map<std::string, std::string>>;

struct AssetBalance {
    std::string asset_id;
    std::string account_id;
    amount_t balance = 0;
};

struct QueryResponse {
    Status status = Status::OK;
    std::string reason;
    DetailMap details;
    std::vector<AssetBalance> assets;

    [[nodiscard]] bool ok() const { return status == Status::OK; }

    [[nodiscard]] static QueryResponse failure(Status status, std::string reason) {
        QueryResponse r;
        r.status = status;
        r.reason = std::move(reason);
        return r;
    }
};

}  // namespace coanneal
