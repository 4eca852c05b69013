#include "codec/facade.hpp"

#include "crypto/siphash.hpp"

#include <algorithm>

namespace uuidv47::codec {

namespace {

[[nodiscard]] Result<Uuid> wrong_version(const Uuid& id, uint8_t expected) {
    return Result<Uuid>::err(Error{
        "expected a version " + std::to_string(expected) + " UUID, got version " +
            std::to_string(id.version()),
        ErrorCode::UnexpectedVersion});
}

// XOR the mask into the timestamp and stamp the new version. No branches on
// key or mask bits.
[[nodiscard]] Uuid apply_mask(const Uuid& id, const crypto::Key& key, uint8_t version) noexcept {
    const uint64_t ts = id.timestamp_ms() ^ timestamp_mask(id, key);
    return id.with_timestamp(ts).with_version(version);
}

} // namespace

Seed seed_from(const Uuid& id) noexcept {
    const auto& b = id.bytes();
    Seed seed{};
    seed[0] = static_cast<uint8_t>(b[6] & 0x0F);
    seed[1] = b[7];
    seed[2] = static_cast<uint8_t>(b[8] & 0x3F);
    std::copy(b.begin() + 9, b.end(), seed.begin() + 3);
    return seed;
}

uint64_t timestamp_mask(const Uuid& id, const crypto::Key& key) noexcept {
    const auto seed = seed_from(id);
    return crypto::siphash24(key, seed) & TIMESTAMP_MASK;
}

Result<Uuid> encode(const Uuid& v7, const crypto::Key& key) {
    if (v7.version() != Uuid::VERSION_TIME_ORDERED) {
        return wrong_version(v7, Uuid::VERSION_TIME_ORDERED);
    }
    return Result<Uuid>::ok(apply_mask(v7, key, Uuid::VERSION_RANDOM));
}

Result<Uuid> decode(const Uuid& facade, const crypto::Key& key) {
    if (facade.version() != Uuid::VERSION_RANDOM) {
        return wrong_version(facade, Uuid::VERSION_RANDOM);
    }
    return Result<Uuid>::ok(apply_mask(facade, key, Uuid::VERSION_TIME_ORDERED));
}

Result<std::string> encode_text(std::string_view text, const crypto::Key& key) {
    return Uuid::parse(text)
        .and_then([&key](const Uuid& v7) { return encode(v7, key); })
        .map([](const Uuid& facade) { return facade.to_string(); });
}

Result<std::string> decode_text(std::string_view text, const crypto::Key& key) {
    return Uuid::parse(text)
        .and_then([&key](const Uuid& facade) { return decode(facade, key); })
        .map([](const Uuid& v7) { return v7.to_string(); });
}

} // namespace uuidv47::codec
