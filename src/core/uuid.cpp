#include "core/uuid.hpp"

#include <type_traits>

namespace uuidv47 {

static_assert(sizeof(Uuid) == Uuid::BYTE_SIZE, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

[[nodiscard]] constexpr bool is_hyphen_offset(size_t offset) noexcept {
    return offset == 8 || offset == 13 || offset == 18 || offset == 23;
}

// -1 for anything outside [0-9a-fA-F].
[[nodiscard]] constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[nodiscard]] Result<Uuid> invalid(std::string message) {
    return Result<Uuid>::err(Error{std::move(message), ErrorCode::InvalidFormat});
}

} // namespace

Result<Uuid> Uuid::parse(std::string_view text) {
    if (text.empty()) {
        return invalid("UUID text is empty");
    }
    if (text.size() != TEXT_SIZE) {
        return invalid("UUID text must be 36 characters, got " + std::to_string(text.size()));
    }

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t offset = 0; offset < TEXT_SIZE; ++offset) {
        const char c = text[offset];
        if (is_hyphen_offset(offset)) {
            if (c != '-') {
                return invalid("expected '-' at offset " + std::to_string(offset));
            }
            continue;
        }

        const int value = hex_value(c);
        if (value < 0) {
            return invalid("non-hex character at offset " + std::to_string(offset));
        }
        auto& byte = bytes[nibble / 2];
        byte = static_cast<uint8_t>((nibble % 2 == 0) ? (value << 4) : (byte | value));
        ++nibble;
    }

    return Result<Uuid>::ok(Uuid(bytes));
}

Uuid::Chars Uuid::to_chars() const noexcept {
    Chars out{};
    size_t pos = 0;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out[pos++] = '-';
        }
        out[pos++] = HEX_DIGITS[bytes_[i] >> 4];
        out[pos++] = HEX_DIGITS[bytes_[i] & 0x0F];
    }
    return out;
}

std::string Uuid::to_string() const {
    const auto chars = to_chars();
    return std::string(chars.data(), chars.size());
}

} // namespace uuidv47
