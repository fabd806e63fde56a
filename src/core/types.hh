#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace coanneal {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// ML-DSA-65 (FIPS 204 / Dilithium Level 3)
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;  // From liboqs OQS_SIG_ml_dsa_65_length_signature

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// ============================================================================
// Ledger Limits
// ============================================================================

inline constexpr std::size_t MAX_DETAIL_VALUE_SIZE = 4096;
inline constexpr std::size_t MAX_DETAIL_KEY_SIZE = 64;
inline constexpr std::size_t MAX_ACCOUNT_NAME_SIZE = 32;
inline constexpr std::size_t MAX_DOMAIN_ID_SIZE = 255;
inline constexpr std::size_t MAX_DESCRIPTION_SIZE = 64;

inline constexpr char ACCOUNT_SEPARATOR = '@';
inline constexpr char ASSET_SEPARATOR = '#';

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using nonce_t = std::uint64_t;
using amount_t = std::uint64_t;

using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

// ============================================================================
// Account Id (name@domain)
// ============================================================================

struct AccountId {
    std::string name;
    std::string domain;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<AccountId> parse(std::string_view id);
    [[nodiscard]] bool is_valid() const;

    auto operator<=>(const AccountId&) const = default;
};

[[nodiscard]] std::string make_asset_id(std::string_view asset_name, std::string_view domain);

// Names follow the ledger's rules: [a-z_0-9]{1,32} for accounts,
// dotted labels for domains, [A-Za-z0-9_]{1,64} for detail keys.
[[nodiscard]] bool is_valid_account_name(std::string_view name);
[[nodiscard]] bool is_valid_domain_id(std::string_view domain);
[[nodiscard]] bool is_valid_detail_key(std::string_view key);

// Number of code points in well-formed UTF-8, nullopt when malformed.
// Detail values are limited in code points, not bytes.
[[nodiscard]] std::optional<std::size_t> utf8_length(std::string_view text);

// ============================================================================
// Time Utilities
// ============================================================================

using steady_time_t = std::chrono::steady_clock::time_point;

[[nodiscard]] inline std::uint64_t now_ms() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (i * 8));
    }
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (i * 8);
    }
    return val;
}

// Append helpers used by canonical payload encoders
void append_u8(std::vector<std::uint8_t>& out, std::uint8_t val);
void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val);
void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val);
void append_string(std::vector<std::uint8_t>& out, std::string_view str);
void append_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes);

// ============================================================================
// Hex Encoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace coanneal

// ============================================================================
// Hash specializations (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<coanneal::hash_t> {
    std::size_t operator()(const coanneal::hash_t& h) const noexcept {
        // Use first 8 bytes as hash (already cryptographic quality)
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<coanneal::AccountId> {
    std::size_t operator()(const coanneal::AccountId& id) const noexcept {
        std::size_t h1 = std::hash<std::string>{}(id.name);
        std::size_t h2 = std::hash<std::string>{}(id.domain);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace std
