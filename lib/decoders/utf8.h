#pragma once
#include <cstdint>
#include <optional>
#include <span>

namespace borsh {

class Utf8 {
   public:
    // Offset of the first byte that does not start a well-formed UTF-8 sequence
    // (overlong forms, surrogates and code points above U+10FFFF are ill-formed).
    static std::optional<size_t> find_invalid(std::span<const uint8_t> data);
};

}  // namespace borsh
