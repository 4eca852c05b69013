#include "core/uuid_v7.hpp"

#include "crypto/keys.hpp"

#include <chrono>

namespace uuidv47 {

namespace {

[[nodiscard]] Uuid::Bytes random_bytes_with_markers(uint8_t version) {
    Uuid::Bytes bytes;
    crypto::random_fill(bytes.data(), bytes.size());

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (version << 4));
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | (Uuid::VARIANT_RFC4122 << 6));
    return bytes;
}

} // namespace

Uuid generate_v7(uint64_t unix_ms) {
    return Uuid(random_bytes_with_markers(Uuid::VERSION_TIME_ORDERED))
        .with_timestamp(unix_ms & MAX_TIMESTAMP_MS);
}

Uuid generate_v7() {
    return generate_v7(now_unix_ms());
}

Uuid generate_v4() {
    return Uuid(random_bytes_with_markers(Uuid::VERSION_RANDOM));
}

uint64_t now_unix_ms() {
    using namespace std::chrono;
    const auto since_epoch = system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(duration_cast<milliseconds>(since_epoch).count());
}

} // namespace uuidv47
