#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace uuidv47 {

/**
 * Uuid - a 128-bit identifier stored as 16 big-endian bytes.
 *
 * Field layout shared by versions 4 and 7:
 *
 *   bytes 0..5   48-bit unix_ts_ms (v7 only)
 *   byte  6      version nibble | rand_a[11:8]
 *   byte  7      rand_a[7:0]
 *   byte  8      variant (2 bits) | rand_b[61:56]
 *   bytes 9..15  rand_b[55:0]
 *
 * Values are immutable; the with_* helpers return modified copies.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    static constexpr size_t TEXT_SIZE = 36;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;
    using Chars = std::array<char, TEXT_SIZE>;

    static constexpr uint8_t VERSION_RANDOM = 4;
    static constexpr uint8_t VERSION_TIME_ORDERED = 7;
    static constexpr uint8_t VARIANT_RFC4122 = 0b10;

    /**
     * Nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Strict parse of the canonical 8-4-4-4-12 form.
     *
     * Exactly 36 characters, hyphens at offsets 8, 13, 18 and 23, hex digits
     * (either case) everywhere else. Anything else is ErrorCode::InvalidFormat.
     */
    [[nodiscard]] static Result<Uuid> parse(std::string_view text);

    /**
     * Canonical lowercase text, written into a fixed buffer.
     */
    [[nodiscard]] Chars to_chars() const noexcept;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(bytes_[6] >> 4);
    }

    /**
     * The two most significant bits of byte 8.
     */
    [[nodiscard]] constexpr uint8_t variant() const noexcept {
        return static_cast<uint8_t>(bytes_[8] >> 6);
    }

    /**
     * The leading 48-bit field. Milliseconds since the Unix epoch for v7.
     */
    [[nodiscard]] constexpr uint64_t timestamp_ms() const noexcept {
        uint64_t ts = 0;
        for (size_t i = 0; i < 6; ++i) {
            ts = (ts << 8) | bytes_[i];
        }
        return ts;
    }

    [[nodiscard]] constexpr uint16_t rand_a() const noexcept {
        return static_cast<uint16_t>(((bytes_[6] & 0x0F) << 8) | bytes_[7]);
    }

    [[nodiscard]] constexpr uint64_t rand_b() const noexcept {
        uint64_t value = bytes_[8] & 0x3F;
        for (size_t i = 9; i < BYTE_SIZE; ++i) {
            value = (value << 8) | bytes_[i];
        }
        return value;
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * Copy with the version nibble replaced. Every other bit is preserved.
     */
    [[nodiscard]] constexpr Uuid with_version(uint8_t version) const noexcept {
        Bytes out = bytes_;
        out[6] = static_cast<uint8_t>((out[6] & 0x0F) | ((version & 0x0F) << 4));
        return Uuid(out);
    }

    /**
     * Copy with the 48-bit leading field replaced.
     */
    [[nodiscard]] constexpr Uuid with_timestamp(uint64_t ts48) const noexcept {
        Bytes out = bytes_;
        for (size_t i = 0; i < 6; ++i) {
            out[5 - i] = static_cast<uint8_t>(ts48 >> (8 * i));
        }
        return Uuid(out);
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

} // namespace uuidv47

namespace std {
    template<>
    struct hash<uuidv47::Uuid> {
        size_t operator()(const uuidv47::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
