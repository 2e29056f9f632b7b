#pragma once
#include <cstdint>
#include <vector>

#include "../decoder.h"
#include "length_prefix.h"

namespace borsh {

// Length-prefixed raw bytes, allocated in full up front once the length is checked.
struct ByteBuffer {
    std::vector<uint8_t> bytes;

    bool operator==(const ByteBuffer&) const = default;
};

template <>
struct Decoder<ByteBuffer> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<ByteBuffer, DecodeError> decode(ByteSource& source);
};

}  // namespace borsh
