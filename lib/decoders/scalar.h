#pragma once
#include <spdlog/spdlog.h>

#include <array>
#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <format>
#include <span>
#include <string_view>
#include <type_traits>

#include "../decoder.h"

namespace borsh {

template <typename T>
struct UnsignedOf {
    using type = std::make_unsigned_t<T>;
};

#ifdef __SIZEOF_INT128__
template <>
struct UnsignedOf<__int128> {
    using type = unsigned __int128;
};

template <>
struct UnsignedOf<unsigned __int128> {
    using type = unsigned __int128;
};
#endif

template <typename T>
concept WireInteger = (std::integral<T> && !std::same_as<T, bool>)
#ifdef __SIZEOF_INT128__
                      || std::same_as<T, __int128> || std::same_as<T, unsigned __int128>
#endif
    ;

template <WireInteger T>
T load_le(std::span<const uint8_t, sizeof(T)> data) {
    using U = typename UnsignedOf<T>::type;
    U value{};
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<U>(static_cast<U>(data[i]) << (8 * i));
    }
    return static_cast<T>(value);
}

template <WireInteger T>
struct Decoder<T> {
    static constexpr size_t min_wire_size = sizeof(T);

    static std::expected<T, DecodeError> decode(ByteSource& source) {
        std::array<uint8_t, sizeof(T)> data{};
        if (auto res = source.read(data); !res) {
            return std::unexpected(res.error());
        }
        return load_le<T>(data);
    }
};

// NaN bit patterns differ across architectures (signalling vs quiet), so they are rejected.
template <std::floating_point T>
    requires(sizeof(T) == 4 || sizeof(T) == 8)
struct Decoder<T> {
    using Bits = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;

    static constexpr size_t min_wire_size = sizeof(T);

    static std::expected<T, DecodeError> decode(ByteSource& source) {
        const auto bits = Decoder<Bits>::decode(source);
        if (!bits) {
            return std::unexpected(bits.error());
        }
        const auto value = std::bit_cast<T>(*bits);
        if (std::isnan(value)) {
            spdlog::error("rejected NaN float (bits: 0x{:0{}X})", *bits, sizeof(T) * 2);
            return std::unexpected(
                DecodeError{ErrorKind::InvalidInput,
                            "For portability reasons we do not allow to deserialize NaNs."});
        }
        return value;
    }
};

// Reads a bool/optional flag byte. Lenient mode accepts any byte; strict mode only 0 and 1.
inline std::expected<uint8_t, DecodeError> read_flag_byte(ByteSource& source,
                                                          std::string_view what) {
    const auto flag = source.read_byte();
    if (!flag) {
        return std::unexpected(flag.error());
    }
    if (source.config().strict_flags && *flag > 1) {
        spdlog::error("non-canonical {} flag byte: {}", what, *flag);
        return std::unexpected(DecodeError{
            ErrorKind::InvalidInput, std::format("Invalid {} flag byte: {}", what, *flag)});
    }
    return *flag;
}

template <>
struct Decoder<bool> {
    static constexpr size_t min_wire_size = 1;

    static std::expected<bool, DecodeError> decode(ByteSource& source) {
        const auto flag = read_flag_byte(source, "bool");
        if (!flag) {
            return std::unexpected(flag.error());
        }
        return *flag == 1;
    }
};

}  // namespace borsh
