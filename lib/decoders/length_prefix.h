#pragma once
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

#include "../decoder.h"
#include "scalar.h"

namespace borsh {

constexpr size_t LENGTH_PREFIX_SIZE = sizeof(uint32_t);

// Rejects a declared element count the remaining input cannot possibly hold, before
// anything is allocated. Zero-sized elements are still limited to one per remaining byte.
// Returns the pre-allocation capacity to use.
inline std::expected<size_t, DecodeError> bound_declared_length(const ByteSource& source,
                                                                uint32_t len,
                                                                size_t elem_min_size,
                                                                std::string_view what,
                                                                ErrorKind kind) {
    const auto remaining = source.remaining();
    const auto divisor = std::max<size_t>(elem_min_size, 1);
    const auto fits = remaining / divisor;
    if (len > fits) {
        spdlog::error("declared {} length exceeds remaining input (len: {}, min elem size: {}, "
                      "remaining: {})",
                      what, len, elem_min_size, remaining);
        return std::unexpected(DecodeError{
            kind, std::format("Declared {} length {} exceeds remaining input of {} bytes", what,
                              len, remaining)});
    }
    return std::min<size_t>(len, fits);
}

// Reads the u32 length prefix and bounds it against the remaining input.
template <typename Elem>
std::expected<std::pair<uint32_t, size_t>, DecodeError> read_length_prefix(
    ByteSource& source, std::string_view what, ErrorKind kind = ErrorKind::UnexpectedEof) {
    const auto len = Decoder<uint32_t>::decode(source);
    if (!len) {
        return std::unexpected(len.error());
    }
    const auto capacity = bound_declared_length(source, *len, min_wire_size_v<Elem>, what, kind);
    if (!capacity) {
        return std::unexpected(capacity.error());
    }
    spdlog::trace("{} length prefix: {} (capacity: {})", what, *len, *capacity);
    return std::pair{*len, *capacity};
}

}  // namespace borsh
