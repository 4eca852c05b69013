#pragma once

#include "core/uuid.hpp"

#include <cstdint>

namespace uuidv47 {

// Largest value the 48-bit unix_ts_ms field can carry.
constexpr uint64_t MAX_TIMESTAMP_MS = 0x0000FFFFFFFFFFFFULL;

/**
 * Generate a UUIDv7 for the given Unix time in milliseconds.
 *
 * The timestamp is truncated to 48 bits; the 74 remaining bits come from the
 * libsodium CSPRNG. crypto::init() must have succeeded first.
 */
[[nodiscard]] Uuid generate_v7(uint64_t unix_ms);

/**
 * Generate a UUIDv7 for the current system time.
 */
[[nodiscard]] Uuid generate_v7();

/**
 * Generate a random UUIDv4.
 */
[[nodiscard]] Uuid generate_v4();

/**
 * Milliseconds since the Unix epoch from the system clock.
 */
[[nodiscard]] uint64_t now_unix_ms();

} // namespace uuidv47
