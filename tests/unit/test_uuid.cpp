#include <catch2/catch_test_macros.hpp>
#include "core/uuid.hpp"

#include <string>
#include <unordered_set>

using namespace uuidv47;

namespace {
constexpr const char* SAMPLE = "018f2d9f-9a2a-7def-8c3f-7b1a2c4d5e6f";
}

TEST_CASE("Uuid default is nil", "[uuid]") {
    Uuid id;
    REQUIRE(id.is_nil());
    REQUIRE(id.to_string() == "00000000-0000-0000-0000-000000000000");
}

TEST_CASE("Uuid::parse decodes bytes in order", "[uuid]") {
    auto result = Uuid::parse(SAMPLE);
    REQUIRE(result.is_ok());

    const auto& bytes = result.unwrap().bytes();
    const Uuid::Bytes expected{0x01, 0x8f, 0x2d, 0x9f, 0x9a, 0x2a, 0x7d, 0xef,
                               0x8c, 0x3f, 0x7b, 0x1a, 0x2c, 0x4d, 0x5e, 0x6f};
    REQUIRE(bytes == expected);
}

TEST_CASE("Uuid::parse accepts uppercase and formats lowercase", "[uuid]") {
    auto result = Uuid::parse("018F2D9F-9A2A-7DEF-8C3F-7B1A2C4D5E6F");
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().to_string() == SAMPLE);
}

TEST_CASE("Uuid::parse rejects malformed text", "[uuid]") {
    const std::string valid = SAMPLE;

    SECTION("empty") {
        auto result = Uuid::parse("");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidFormat);
    }

    SECTION("not a uuid") {
        REQUIRE(Uuid::parse("not-a-uuid").is_err());
    }

    SECTION("truncated to 35 characters") {
        REQUIRE(Uuid::parse(valid.substr(0, 35)).is_err());
    }

    SECTION("one extra character") {
        REQUIRE(Uuid::parse(valid + "0").is_err());
    }

    SECTION("non-hex digit") {
        auto bad = valid;
        bad[0] = 'g';
        auto result = Uuid::parse(bad);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidFormat);
        REQUIRE(result.unwrap_err().message.find("offset 0") != std::string::npos);
    }

    SECTION("hyphen moved") {
        // 018f2d9f9-a2a-... : hyphen at offset 9 instead of 8
        auto bad = valid;
        std::swap(bad[8], bad[9]);
        REQUIRE(Uuid::parse(bad).is_err());
    }

    SECTION("hyphens missing (32 hex digits)") {
        REQUIRE(Uuid::parse("018f2d9f9a2a7def8c3f7b1a2c4d5e6f").is_err());
    }

    SECTION("braced form") {
        REQUIRE(Uuid::parse("{018f2d9f-9a2a-7def-8c3f-7b1a2c4d5e6}").is_err());
    }

    SECTION("whitespace padding") {
        REQUIRE(Uuid::parse(" 018f2d9f-9a2a-7def-8c3f-7b1a2c4d5e6").is_err());
    }

    SECTION("hyphen replaced by hex digit") {
        auto bad = valid;
        bad[13] = '0';
        REQUIRE(Uuid::parse(bad).is_err());
    }
}

TEST_CASE("Uuid field accessors follow the RFC 9562 layout", "[uuid]") {
    const auto id = Uuid::parse(SAMPLE).unwrap();

    REQUIRE(id.timestamp_ms() == 0x018f2d9f9a2aULL);
    REQUIRE(id.version() == 7);
    REQUIRE(id.rand_a() == 0xdef);
    REQUIRE(id.variant() == Uuid::VARIANT_RFC4122);
    REQUIRE(id.rand_b() == 0x0c3f7b1a2c4d5e6fULL);
}

TEST_CASE("Uuid::with_version only touches the version nibble", "[uuid]") {
    const auto id = Uuid::parse(SAMPLE).unwrap();
    const auto v4 = id.with_version(4);

    REQUIRE(v4.version() == 4);
    REQUIRE(v4.to_string() == "018f2d9f-9a2a-4def-8c3f-7b1a2c4d5e6f");
    REQUIRE(v4.with_version(7) == id);
}

TEST_CASE("Uuid::with_timestamp writes 48 big-endian bits", "[uuid]") {
    const auto id = Uuid::parse(SAMPLE).unwrap().with_timestamp(0x0000112233445566ULL);
    REQUIRE(id.to_string() == "11223344-5566-7def-8c3f-7b1a2c4d5e6f");
    REQUIRE(id.timestamp_ms() == 0x112233445566ULL);
}

TEST_CASE("Uuid::to_chars matches to_string", "[uuid]") {
    const auto id = Uuid::parse(SAMPLE).unwrap();
    const auto chars = id.to_chars();
    REQUIRE(std::string(chars.data(), chars.size()) == id.to_string());
}

TEST_CASE("Uuid is hashable and ordered bytewise", "[uuid]") {
    const auto a = Uuid::parse("00000000-0000-7000-8000-000000000001").unwrap();
    const auto b = Uuid::parse("00000000-0000-7000-8000-000000000002").unwrap();

    REQUIRE(a < b);
    std::unordered_set<Uuid> set{a, b, a};
    REQUIRE(set.size() == 2);
}
