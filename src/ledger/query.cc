#include "query.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include "core/logging.hh"

namespace coanneal {

namespace {

constexpr std::uint8_t QUERY_DOMAIN_TAG = 0x51;  // 'Q'

void append_optional(std::vector<std::uint8_t>& out, const std::optional<std::string>& value) {
    append_u8(out, value ? 1 : 0);
    if (value) {
        append_string(out, *value);
    }
}

}  // namespace

QueryType query_type(const QueryPayload& payload) {
    return std::holds_alternative<GetAccountAssets>(payload)
        ? QueryType::GET_ACCOUNT_ASSETS
        : QueryType::GET_ACCOUNT_DETAIL;
}

std::vector<std::uint8_t> Query::encode() const {
    std::vector<std::uint8_t> out;
    append_u8(out, QUERY_DOMAIN_TAG);
    append_string(out, creator_account_id);
    append_u64(out, created_time_ms);
    append_u64(out, counter);
    append_u8(out, static_cast<std::uint8_t>(query_type(payload)));

    if (const auto* assets = std::get_if<GetAccountAssets>(&payload)) {
        append_string(out, assets->account_id);
    } else if (const auto* detail = std::get_if<GetAccountDetail>(&payload)) {
        append_string(out, detail->account_id);
        append_optional(out, detail->writer);
        append_optional(out, detail->key);
    }
    return out;
}

hash_t Query::hash() const {
    return sha3_256(encode());
}

bool SignedQuery::verify() const {
    auto h = query.hash();
    return mldsa_verify(signer, h, signature);
}

std::optional<SignedQuery> SignedQuery::sign(Query query, const MLDSAKeyPair& keys) {
    auto h = query.hash();
    auto sig = keys.sign(h);
    if (!sig) {
        log::ledger.error() << "Cannot sign query of " << query.creator_account_id;
        return std::nullopt;
    }
    return SignedQuery{std::move(query), keys.public_key(), *sig};
}

}  // namespace coanneal
