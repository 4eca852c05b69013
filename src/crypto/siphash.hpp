#pragma once

#include "crypto/keys.hpp"

#include <cstdint>
#include <span>

namespace uuidv47::crypto {

// SipHash output size (crypto_shorthash_siphash24_BYTES)
constexpr size_t SIPHASH_SIZE = 8;

/**
 * SipHash-2-4 of `message` under `key`, as a little-endian 64-bit integer.
 *
 * Runs in time independent of the key and message contents.
 */
[[nodiscard]] uint64_t siphash24(const Key& key, std::span<const uint8_t> message) noexcept;

} // namespace uuidv47::crypto
