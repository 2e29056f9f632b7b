#include <array>
#include <catch2/catch_test_macros.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "borsh.h"
#include "wire_bytes.h"

using borsh::ByteSource;
using borsh::DecoderConfig;
using borsh::ErrorKind;

TEST_CASE("optional decoder") {
    SECTION ("present value") {
        constexpr auto bytes = std::to_array<uint8_t>({0x01, 0x2a});
        ByteSource src{bytes};
        REQUIRE(*borsh::deserialize<std::optional<uint8_t>>(src) == std::optional<uint8_t>{42});
    }

    SECTION ("absent value consumes one byte") {
        constexpr auto bytes = std::to_array<uint8_t>({0x00, 0x2a});
        ByteSource src{bytes};
        REQUIRE(*borsh::deserialize<std::optional<uint8_t>>(src) == std::nullopt);
        REQUIRE(src.remaining() == 1);
    }

    SECTION ("any nonzero flag means present by default") {
        constexpr auto bytes = std::to_array<uint8_t>({0x07, 0x2a});
        ByteSource src{bytes};
        REQUIRE(*borsh::deserialize<std::optional<uint8_t>>(src) == std::optional<uint8_t>{42});
    }

    SECTION ("strict flags reject a flag of 2") {
        constexpr auto bytes = std::to_array<uint8_t>({0x02, 0x2a});
        ByteSource src{bytes, DecoderConfig{.strict_flags = true}};
        auto res = borsh::deserialize<std::optional<uint8_t>>(src);
        REQUIRE(!res);
        REQUIRE(res.error().kind == ErrorKind::InvalidInput);
    }

    SECTION ("present flag without payload") {
        constexpr auto bytes = std::to_array<uint8_t>({0x01});
        ByteSource src{bytes};
        REQUIRE(borsh::deserialize<std::optional<uint32_t>>(src).error().kind ==
                ErrorKind::UnexpectedEof);
    }
}

TEST_CASE("sequence decoder") {
    SECTION ("decodes elements in order") {
        const auto bytes = WireBytes{}.u32(3).u16(1).u16(2).u16(3);
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::vector<uint16_t>>(src) ==
                std::vector<uint16_t>{1, 2, 3});
    }

    SECTION ("nested sequences of strings") {
        const auto bytes = WireBytes{}.u32(2).u32(1).str("a").u32(0);
        ByteSource src{bytes.bytes()};
        const auto res = borsh::deserialize<std::vector<std::vector<std::string>>>(src);
        REQUIRE(res.has_value());
        REQUIRE(res->size() == 2);
        REQUIRE((*res)[0] == std::vector<std::string>{"a"});
        REQUIRE((*res)[1].empty());
    }

    SECTION ("declared length larger than the input can hold") {
        const auto bytes = WireBytes{}.u32(0x7fffffff).u64(1);
        ByteSource src{bytes.bytes()};
        auto res = borsh::deserialize<std::vector<uint64_t>>(src);
        REQUIRE(!res);
        REQUIRE(res.error().kind == ErrorKind::UnexpectedEof);
    }

    SECTION ("element failure aborts the sequence") {
        const auto bytes = WireBytes{}.u32(2).u32(0x3fc00000).u32(0x7fc00000);
        ByteSource src{bytes.bytes()};
        auto res = borsh::deserialize<std::vector<float>>(src);
        REQUIRE(!res);
        REQUIRE(res.error().kind == ErrorKind::InvalidInput);
    }

    SECTION ("zero-sized elements are limited by the remaining input") {
        const auto bytes = WireBytes{}.u32(3).raw({0x00, 0x00, 0x00});
        ByteSource src{bytes.bytes()};
        auto res = borsh::deserialize<std::vector<std::tuple<>>>(src);
        REQUIRE(res.has_value());
        REQUIRE(res->size() == 3);
        REQUIRE(src.remaining() == 3);
    }

    SECTION ("huge count of zero-sized elements fails without allocating") {
        const auto bytes = WireBytes{}.u32(0xffffffff);
        ByteSource src{bytes.bytes()};
        auto res = borsh::deserialize<std::vector<std::tuple<>>>(src);
        REQUIRE(!res);
        REQUIRE(res.error().kind == ErrorKind::UnexpectedEof);
    }

    SECTION ("huge count of zero-length arrays fails without allocating") {
        const auto bytes = WireBytes{}.u32(0xffffffff).u8(0);
        ByteSource src{bytes.bytes()};
        REQUIRE(borsh::deserialize<std::vector<std::array<uint32_t, 0>>>(src).error().kind ==
                ErrorKind::UnexpectedEof);
    }
}

TEST_CASE("set decoders") {
    const auto bytes = WireBytes{}.u32(4).u8(3).u8(1).u8(3).u8(2);

    SECTION ("hash set collapses duplicates") {
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::unordered_set<uint8_t>>(src) ==
                std::unordered_set<uint8_t>{1, 2, 3});
    }

    SECTION ("ordered set collapses duplicates") {
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::set<uint8_t>>(src) == std::set<uint8_t>{1, 2, 3});
    }
}

TEST_CASE("map decoders") {
    SECTION ("hash map") {
        const auto bytes = WireBytes{}.u32(2).str("a").u32(1).str("b").u32(2);
        ByteSource src{bytes.bytes()};
        const auto res = borsh::deserialize<std::unordered_map<std::string, uint32_t>>(src);
        REQUIRE(res.has_value());
        REQUIRE(*res == std::unordered_map<std::string, uint32_t>{{"a", 1}, {"b", 2}});
    }

    SECTION ("hash map keeps the later value for a repeated key") {
        const auto bytes = WireBytes{}.u32(3).str("k").u32(1).str("j").u32(2).str("k").u32(3);
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::unordered_map<std::string, uint32_t>>(src) ==
                std::unordered_map<std::string, uint32_t>{{"k", 3}, {"j", 2}});
    }

    SECTION ("ordered map keeps the later value for a repeated key") {
        const auto bytes = WireBytes{}.u32(3).u8(5).u8(10).u8(1).u8(20).u8(5).u8(30);
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::map<uint8_t, uint8_t>>(src) ==
                std::map<uint8_t, uint8_t>{{1, 20}, {5, 30}});
    }

    SECTION ("count larger than the input can hold") {
        const auto bytes = WireBytes{}.u32(1000).u8(1).u8(2);
        ByteSource src{bytes.bytes()};
        REQUIRE(borsh::deserialize<std::map<uint8_t, uint8_t>>(src).error().kind ==
                ErrorKind::UnexpectedEof);
    }

    SECTION ("value failure aborts the map") {
        const auto bytes = WireBytes{}.u32(1).u8(1).u8(2);
        ByteSource src{bytes.bytes()};
        REQUIRE(borsh::deserialize<std::unordered_map<uint8_t, std::optional<uint32_t>>>(src)
                    .error()
                    .kind == ErrorKind::UnexpectedEof);
    }
}

TEST_CASE("fixed-size array decoder") {
    SECTION ("no length prefix") {
        const auto bytes = WireBytes{}.u16(7).u16(8).u16(9);
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::array<uint16_t, 3>>(src) ==
                std::array<uint16_t, 3>{7, 8, 9});
        REQUIRE(src.remaining() == 0);
    }

    SECTION ("zero-length array consumes nothing") {
        const auto bytes = WireBytes{}.u8(1);
        ByteSource src{bytes.bytes()};
        REQUIRE(borsh::deserialize<std::array<uint32_t, 0>>(src).has_value());
        REQUIRE(src.remaining() == 1);
    }

    SECTION ("short input") {
        const auto bytes = WireBytes{}.u16(7);
        ByteSource src{bytes.bytes()};
        REQUIRE(borsh::deserialize<std::array<uint16_t, 2>>(src).error().kind ==
                ErrorKind::UnexpectedEof);
    }

    SECTION ("array of strings") {
        const auto bytes = WireBytes{}.str("x").str("yz");
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::array<std::string, 2>>(src) ==
                std::array<std::string, 2>{"x", "yz"});
    }
}

TEST_CASE("tuple decoder") {
    SECTION ("components left to right") {
        const auto bytes = WireBytes{}.u8(1).str("two").u64(3);
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::tuple<uint8_t, std::string, uint64_t>>(src) ==
                std::tuple<uint8_t, std::string, uint64_t>{1, "two", 3});
    }

    SECTION ("pair") {
        const auto bytes = WireBytes{}.u8(1).u8(0);
        ByteSource src{bytes.bytes()};
        REQUIRE(*borsh::deserialize<std::pair<bool, bool>>(src) == std::pair{true, false});
    }

    SECTION ("first failure stops decoding") {
        const auto bytes = WireBytes{}.u32(0x7fc00000).u8(9);
        ByteSource src{bytes.bytes()};
        auto res = borsh::deserialize<std::tuple<float, uint8_t>>(src);
        REQUIRE(!res);
        REQUIRE(res.error().kind == ErrorKind::InvalidInput);
        REQUIRE(src.remaining() == 1);
    }

    SECTION ("twenty components") {
        WireBytes wire{};
        for (uint8_t i = 0; i < 20; ++i) {
            wire.u8(i);
        }
        using Wide = std::tuple<uint8_t, uint8_t, uint8_t, uint8_t, uint8_t, uint8_t, uint8_t,
                                uint8_t, uint8_t, uint8_t, uint8_t, uint8_t, uint8_t, uint8_t,
                                uint8_t, uint8_t, uint8_t, uint8_t, uint8_t, uint8_t>;
        ByteSource src{wire.bytes()};
        const auto res = borsh::deserialize<Wide>(src);
        REQUIRE(res.has_value());
        REQUIRE(std::get<0>(*res) == 0);
        REQUIRE(std::get<19>(*res) == 19);
    }
}

TEST_CASE("nesting depth limit") {
    const auto bytes = WireBytes{}.u32(1).u32(1).u32(1).u8(4);

    SECTION ("within the limit") {
        ByteSource src{bytes.bytes(), DecoderConfig{.max_depth = 3}};
        const auto res = borsh::deserialize<std::vector<std::vector<std::vector<uint8_t>>>>(src);
        REQUIRE(res.has_value());
        REQUIRE((*res)[0][0][0] == 4);
    }

    SECTION ("beyond the limit") {
        ByteSource src{bytes.bytes(), DecoderConfig{.max_depth = 2}};
        const auto res = borsh::deserialize<std::vector<std::vector<std::vector<uint8_t>>>>(src);
        REQUIRE(!res);
        REQUIRE(res.error().kind == ErrorKind::InvalidInput);
    }
}
