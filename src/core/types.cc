#include "types.hh"
#include <algorithm>
#include <atomic>
#include <cstring>

namespace coanneal {

// ============================================================================
// AccountId Implementation
// ============================================================================

std::string AccountId::to_string() const {
    return name + ACCOUNT_SEPARATOR + domain;
}

std::optional<AccountId> AccountId::parse(std::string_view id) {
    auto pos = id.find(ACCOUNT_SEPARATOR);
    if (pos == std::string_view::npos || id.find(ACCOUNT_SEPARATOR, pos + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    AccountId result{std::string(id.substr(0, pos)), std::string(id.substr(pos + 1))};
    if (!result.is_valid()) {
        return std::nullopt;
    }
    return result;
}

bool AccountId::is_valid() const {
    return is_valid_account_name(name) && is_valid_domain_id(domain);
}

std::string make_asset_id(std::string_view asset_name, std::string_view domain) {
    std::string id(asset_name);
    id.push_back(ASSET_SEPARATOR);
    id.append(domain);
    return id;
}

// ============================================================================
// Name Validation
// ============================================================================

bool is_valid_account_name(std::string_view name) {
    if (name.empty() || name.size() > MAX_ACCOUNT_NAME_SIZE) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

bool is_valid_domain_id(std::string_view domain) {
    if (domain.empty() || domain.size() > MAX_DOMAIN_ID_SIZE) {
        return false;
    }
    if (domain.front() == '.' || domain.back() == '.') {
        return false;
    }
    char prev = 0;
    for (char c : domain) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '.';
        if (!ok || (c == '.' && prev == '.')) {
            return false;
        }
        prev = c;
    }
    return true;
}

bool is_valid_detail_key(std::string_view key) {
    if (key.empty() || key.size() > MAX_DETAIL_KEY_SIZE) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_';
    });
}

// ============================================================================
// Append Helpers
// ============================================================================

void append_u8(std::vector<std::uint8_t>& out, std::uint8_t val) {
    out.push_back(val);
}

void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_string(std::vector<std::uint8_t>& out, std::string_view str) {
    append_u32(out, static_cast<std::uint32_t>(str.size()));
    out.insert(out.end(), str.begin(), str.end());
}

void append_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::optional<std::size_t> utf8_length(std::string_view text) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<std::uint8_t>(text[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return std::nullopt;
        }
        if (text.size() - i <= extra) {
            return std::nullopt;    // Truncated sequence
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<std::uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return std::nullopt;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        // Overlong forms, UTF-16 surrogates and values past U+10FFFF
        static constexpr std::uint32_t MIN_FOR_LENGTH[] = {0, 0x80, 0x800, 0x10000};
        if (cp < MIN_FOR_LENGTH[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return std::nullopt;
        }
        i += extra + 1;
        ++count;
    }
    return count;
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

}  // namespace coanneal
