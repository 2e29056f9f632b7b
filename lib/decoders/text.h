#pragma once
#include <string>

#include "../decoder.h"
#include "length_prefix.h"

namespace borsh {

template <>
struct Decoder<std::string> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<std::string, DecodeError> decode(ByteSource& source);
};

}  // namespace borsh
