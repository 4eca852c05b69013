#include "crypto/siphash.hpp"

#include <array>

#include <sodium.h>

namespace uuidv47::crypto {

static_assert(KEY_SIZE == crypto_shorthash_siphash24_KEYBYTES, "SipHash key size mismatch");
static_assert(SIPHASH_SIZE == crypto_shorthash_siphash24_BYTES, "SipHash output size mismatch");

uint64_t siphash24(const Key& key, std::span<const uint8_t> message) noexcept {
    auto kb = key_bytes(key);
    std::array<uint8_t, SIPHASH_SIZE> out{};

    // Cannot fail for the 2-4 variant; the return value is always 0.
    (void)crypto_shorthash_siphash24(out.data(), message.data(), message.size(), kb.data());
    secure_zero(kb.data(), kb.size());

    uint64_t value = 0;
    for (size_t i = 0; i < SIPHASH_SIZE; ++i) {
        value |= static_cast<uint64_t>(out[i]) << (8 * i);
    }
    return value;
}

} // namespace uuidv47::crypto
