#pragma once
#include <spdlog/spdlog.h>

#include <cstdint>
#include <expected>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "byte_source.h"
#include "decode_error.h"
#include "decoder.h"
#include "decoder_config.h"
#include "decoders/byte_buffer.h"
#include "decoders/containers.h"
#include "decoders/scalar.h"
#include "decoders/text.h"
#include "net/socket_addr.h"

namespace borsh {

constexpr std::string_view ERROR_NOT_ALL_BYTES_READ = "Not all bytes read";

// Decodes exactly one T from data; trailing bytes are an error. The input is copied first,
// so the caller's buffer is never aliased by the source.
template <typename T>
std::expected<T, DecodeError> try_from_slice(std::span<const uint8_t> data,
                                             const DecoderConfig& config = {}) {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        spdlog::error("invalid decoder config: {}", e.what());
        return std::unexpected(DecodeError{ErrorKind::InvalidInput,
                                           std::string("Invalid decoder config: ") + e.what()});
    }

    const std::vector<uint8_t> input(data.begin(), data.end());
    ByteSource source{input, config};

    auto result = deserialize<T>(source);
    if (!result) {
        spdlog::debug("decode failed after {} of {} bytes: {}", input.size() - source.remaining(),
                      input.size(), result.error().to_string());
        return std::unexpected(result.error());
    }
    if (source.remaining() > 0) {
        spdlog::error("{} ({} trailing bytes)", ERROR_NOT_ALL_BYTES_READ, source.remaining());
        return std::unexpected(
            DecodeError{ErrorKind::InvalidData, std::string(ERROR_NOT_ALL_BYTES_READ)});
    }
    spdlog::debug("decoded {} bytes", input.size());
    return result;
}

template <typename T>
T from_slice(std::span<const uint8_t> data, const DecoderConfig& config = {}) {
    auto result = try_from_slice<T>(data, config);
    if (!result) {
        throw DecodeException(std::move(result.error()));
    }
    return std::move(*result);
}

}  // namespace borsh
