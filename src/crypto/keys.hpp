#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuidv47::crypto {

// SipHash-2-4 key size (matches crypto_shorthash_siphash24_KEYBYTES)
constexpr size_t KEY_SIZE = 16;

using KeyBytes = std::array<uint8_t, KEY_SIZE>;

/**
 * Key - the 128-bit facade key, as two independent 64-bit halves.
 *
 * The halves are order-significant: {a, b} and {b, a} are different keys.
 */
struct Key {
    uint64_t k0{0};
    uint64_t k1{0};

    bool operator==(const Key&) const = default;
};

/**
 * Initialize libsodium. Safe to call more than once; required before
 * generate_key() or any of the random UUID generators.
 */
[[nodiscard]] Result<void> init();

/**
 * Generate a fresh key from the libsodium CSPRNG.
 */
[[nodiscard]] Key generate_key();

/**
 * SipHash key bytes: k0 little-endian followed by k1 little-endian.
 */
[[nodiscard]] KeyBytes key_bytes(const Key& key) noexcept;

/**
 * Parse "<k0>:<k1>", each half decimal or 0x-prefixed hex.
 */
[[nodiscard]] Result<Key> parse_key(std::string_view text);

/**
 * Format as "0x<16 hex>:0x<16 hex>".
 */
[[nodiscard]] std::string to_string(const Key& key);

/**
 * Fill a buffer from the libsodium CSPRNG.
 */
void random_fill(uint8_t* data, size_t len);

/**
 * Securely zero memory.
 */
void secure_zero(void* ptr, size_t len);

} // namespace uuidv47::crypto
