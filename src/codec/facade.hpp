#pragma once

#include "core/result.hpp"
#include "core/uuid.hpp"
#include "crypto/keys.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuidv47::codec {

// Mask applied to the 48-bit timestamp field.
constexpr uint64_t TIMESTAMP_MASK = 0x0000FFFFFFFFFFFFULL;

// rand_a (12 bits) + rand_b (62 bits) packed into whole bytes.
constexpr size_t SEED_SIZE = 10;

using Seed = std::array<uint8_t, SEED_SIZE>;

/**
 * Pack the 74 random bits as [byte6 & 0x0F][byte7][byte8 & 0x3F][bytes 9..15].
 *
 * None of these bits change between a UUIDv7 and its facade, so encode and
 * decode derive the same seed.
 */
[[nodiscard]] Seed seed_from(const Uuid& id) noexcept;

/**
 * The 48-bit keyed mask for an identifier: SipHash-2-4(key, seed) & TIMESTAMP_MASK.
 */
[[nodiscard]] uint64_t timestamp_mask(const Uuid& id, const crypto::Key& key) noexcept;

/**
 * Encode a UUIDv7 as a UUIDv4-shaped facade.
 *
 * The timestamp field is XORed with the keyed mask and the version nibble
 * becomes 4. The random bits and variant bits are carried over unchanged.
 * Inputs whose version is not 7 fail with ErrorCode::UnexpectedVersion.
 */
[[nodiscard]] Result<Uuid> encode(const Uuid& v7, const crypto::Key& key);

/**
 * Recover the UUIDv7 behind a facade.
 *
 * A wrong key still yields a well-formed UUIDv7, just not the original one.
 * Inputs whose version is not 4 fail with ErrorCode::UnexpectedVersion.
 */
[[nodiscard]] Result<Uuid> decode(const Uuid& facade, const crypto::Key& key);

/**
 * parse -> encode -> format.
 */
[[nodiscard]] Result<std::string> encode_text(std::string_view text, const crypto::Key& key);

/**
 * parse -> decode -> format.
 */
[[nodiscard]] Result<std::string> decode_text(std::string_view text, const crypto::Key& key);

} // namespace uuidv47::codec
