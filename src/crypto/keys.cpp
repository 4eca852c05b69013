#include "crypto/keys.hpp"

#include <charconv>
#include <cstdio>
#include <system_error>

#include <sodium.h>

namespace uuidv47::crypto {

namespace {

[[nodiscard]] Result<uint64_t> parse_half(std::string_view text, const char* which) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        base = 16;
        if (text.size() > 16) {
            return Result<uint64_t>::err(
                Error{std::string("key half ") + which + " has more than 16 hex digits",
                      ErrorCode::InvalidKey});
        }
    }
    if (text.empty()) {
        return Result<uint64_t>::err(
            Error{std::string("key half ") + which + " is empty", ErrorCode::InvalidKey});
    }

    uint64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (ec == std::errc::result_out_of_range) {
        return Result<uint64_t>::err(
            Error{std::string("key half ") + which + " does not fit in 64 bits",
                  ErrorCode::InvalidKey});
    }
    if (ec != std::errc{} || ptr != last) {
        return Result<uint64_t>::err(
            Error{std::string("key half ") + which + " is not a number", ErrorCode::InvalidKey});
    }
    return Result<uint64_t>::ok(value);
}

void store_le64(uint8_t* out, uint64_t value) noexcept {
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

} // namespace

Result<void> init() {
    if (sodium_init() < 0) {
        return Result<void>::err(Error{"Failed to initialize libsodium", ErrorCode::CryptoInit});
    }
    return Result<void>::ok();
}

Key generate_key() {
    KeyBytes bytes;
    randombytes_buf(bytes.data(), bytes.size());

    Key key;
    for (size_t i = 0; i < 8; ++i) {
        key.k0 |= static_cast<uint64_t>(bytes[i]) << (8 * i);
        key.k1 |= static_cast<uint64_t>(bytes[8 + i]) << (8 * i);
    }
    secure_zero(bytes.data(), bytes.size());
    return key;
}

KeyBytes key_bytes(const Key& key) noexcept {
    KeyBytes out;
    store_le64(out.data(), key.k0);
    store_le64(out.data() + 8, key.k1);
    return out;
}

Result<Key> parse_key(std::string_view text) {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos || text.find(':', colon + 1) != std::string_view::npos) {
        return Result<Key>::err(Error{"key must have the form <k0>:<k1>", ErrorCode::InvalidKey});
    }

    const auto k0 = parse_half(text.substr(0, colon), "k0");
    if (k0.is_err()) {
        return Result<Key>::err(k0.unwrap_err());
    }
    const auto k1 = parse_half(text.substr(colon + 1), "k1");
    if (k1.is_err()) {
        return Result<Key>::err(k1.unwrap_err());
    }
    return Result<Key>::ok(Key{k0.unwrap(), k1.unwrap()});
}

std::string to_string(const Key& key) {
    char buffer[2 * 18 + 2];
    std::snprintf(buffer, sizeof(buffer), "0x%016llx:0x%016llx",
                  static_cast<unsigned long long>(key.k0),
                  static_cast<unsigned long long>(key.k1));
    return buffer;
}

void random_fill(uint8_t* data, size_t len) {
    randombytes_buf(data, len);
}

void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

} // namespace uuidv47::crypto
