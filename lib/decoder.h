#pragma once
#include <concepts>
#include <cstddef>
#include <expected>

#include "byte_source.h"
#include "decode_error.h"

namespace borsh {

// Specialised per supported type; each specialisation provides
//   static std::expected<T, DecodeError> decode(ByteSource& source);
//   static constexpr size_t min_wire_size;
template <typename T>
struct Decoder;

// User aggregates opt in by declaring a static deserialize(ByteSource&).
template <typename T>
concept SelfDecodable = requires(ByteSource& source) {
    { T::deserialize(source) } -> std::same_as<std::expected<T, DecodeError>>;
};

template <typename T>
concept Decodable = requires(ByteSource& source) {
    { Decoder<T>::decode(source) } -> std::same_as<std::expected<T, DecodeError>>;
};

template <Decodable T>
std::expected<T, DecodeError> deserialize(ByteSource& source) {
    return Decoder<T>::decode(source);
}

template <typename T>
constexpr size_t min_wire_size_v = [] {
    if constexpr (requires { Decoder<T>::min_wire_size; }) {
        return static_cast<size_t>(Decoder<T>::min_wire_size);
    } else {
        return size_t{0};
    }
}();

template <SelfDecodable T>
struct Decoder<T> {
    static constexpr size_t min_wire_size = [] {
        if constexpr (requires { T::min_wire_size; }) {
            return static_cast<size_t>(T::min_wire_size);
        } else {
            return size_t{0};
        }
    }();

    static std::expected<T, DecodeError> decode(ByteSource& source) {
        return T::deserialize(source);
    }
};

}  // namespace borsh
