#include "socket_addr.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <spdlog/spdlog.h>

#include <format>

#include "../decoders/scalar.h"

namespace borsh {

std::string Ipv4Addr::to_string() const {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, octets.data(), ip_str, sizeof(ip_str));
    return std::string(ip_str);
}

std::string Ipv6Addr::to_string() const {
    char ip_str[INET6_ADDRSTRLEN];
    inet_ntop(AF_INET6, octets.data(), ip_str, sizeof(ip_str));
    return std::string(ip_str);
}

std::string SocketAddrV4::to_string() const {
    return std::format("{}:{}", ip.to_string(), port);
}

std::string SocketAddrV6::to_string() const {
    return std::format("[{}]:{}", ip.to_string(), port);
}

std::string to_string(const SocketAddr& addr) {
    return std::visit([](const auto& a) { return a.to_string(); }, addr);
}

std::expected<Ipv4Addr, DecodeError> Decoder<Ipv4Addr>::decode(ByteSource& source) {
    Ipv4Addr addr{};
    if (auto res = source.read(addr.octets); !res) {
        return std::unexpected(res.error());
    }
    return addr;
}

std::expected<Ipv6Addr, DecodeError> Decoder<Ipv6Addr>::decode(ByteSource& source) {
    Ipv6Addr addr{};
    if (auto res = source.read(addr.octets); !res) {
        return std::unexpected(res.error());
    }
    return addr;
}

std::expected<SocketAddrV4, DecodeError> Decoder<SocketAddrV4>::decode(ByteSource& source) {
    const auto ip = Decoder<Ipv4Addr>::decode(source);
    if (!ip) {
        return std::unexpected(ip.error());
    }
    const auto port = Decoder<uint16_t>::decode(source);
    if (!port) {
        return std::unexpected(port.error());
    }
    return SocketAddrV4{.ip = *ip, .port = *port};
}

std::expected<SocketAddrV6, DecodeError> Decoder<SocketAddrV6>::decode(ByteSource& source) {
    const auto ip = Decoder<Ipv6Addr>::decode(source);
    if (!ip) {
        return std::unexpected(ip.error());
    }
    const auto port = Decoder<uint16_t>::decode(source);
    if (!port) {
        return std::unexpected(port.error());
    }
    return SocketAddrV6{.ip = *ip, .port = *port, .flowinfo = 0, .scope_id = 0};
}

std::expected<SocketAddr, DecodeError> Decoder<SocketAddr>::decode(ByteSource& source) {
    const auto kind = source.read_byte();
    if (!kind) {
        return std::unexpected(kind.error());
    }
    spdlog::trace("socket address discriminant: {}", *kind);

    switch (static_cast<SocketAddrKind>(*kind)) {
        case SocketAddrKind::V4: {
            if (auto addr = Decoder<SocketAddrV4>::decode(source)) {
                return SocketAddr{*addr};
            } else {
                return std::unexpected(addr.error());
            }
        }
        case SocketAddrKind::V6: {
            if (auto addr = Decoder<SocketAddrV6>::decode(source)) {
                return SocketAddr{*addr};
            } else {
                return std::unexpected(addr.error());
            }
        }
        default: {
            spdlog::error("invalid socket address discriminant: {}", *kind);
            return std::unexpected(DecodeError{
                ErrorKind::InvalidInput, std::format("Invalid SocketAddr variant: {}", *kind)});
        }
    }
}

}  // namespace borsh
