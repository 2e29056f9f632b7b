#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <variant>

#include "../decoder.h"

namespace borsh {

struct Ipv4Addr {
    std::array<uint8_t, 4> octets{};

    std::string to_string() const;
    auto operator<=>(const Ipv4Addr&) const = default;
};

struct Ipv6Addr {
    std::array<uint8_t, 16> octets{};

    std::string to_string() const;
    auto operator<=>(const Ipv6Addr&) const = default;
};

struct SocketAddrV4 {
    Ipv4Addr ip;
    uint16_t port{};

    std::string to_string() const;
    auto operator<=>(const SocketAddrV4&) const = default;
};

// flowinfo and scope_id are not carried on the wire; decoded values always hold zero.
struct SocketAddrV6 {
    Ipv6Addr ip;
    uint16_t port{};
    uint32_t flowinfo{};
    uint32_t scope_id{};

    std::string to_string() const;
    auto operator<=>(const SocketAddrV6&) const = default;
};

using SocketAddr = std::variant<SocketAddrV4, SocketAddrV6>;

enum class SocketAddrKind : uint8_t { V4 = 0, V6 = 1 };

std::string to_string(const SocketAddr& addr);

template <>
struct Decoder<Ipv4Addr> {
    static constexpr size_t min_wire_size = 4;

    static std::expected<Ipv4Addr, DecodeError> decode(ByteSource& source);
};

template <>
struct Decoder<Ipv6Addr> {
    static constexpr size_t min_wire_size = 16;

    static std::expected<Ipv6Addr, DecodeError> decode(ByteSource& source);
};

template <>
struct Decoder<SocketAddrV4> {
    static constexpr size_t min_wire_size = 4 + sizeof(uint16_t);

    static std::expected<SocketAddrV4, DecodeError> decode(ByteSource& source);
};

template <>
struct Decoder<SocketAddrV6> {
    static constexpr size_t min_wire_size = 16 + sizeof(uint16_t);

    static std::expected<SocketAddrV6, DecodeError> decode(ByteSource& source);
};

template <>
struct Decoder<SocketAddr> {
    static constexpr size_t min_wire_size = 1 + Decoder<SocketAddrV4>::min_wire_size;

    static std::expected<SocketAddr, DecodeError> decode(ByteSource& source);
};

}  // namespace borsh
