#include "byte_buffer.h"

#include <spdlog/spdlog.h>

namespace borsh {

std::expected<ByteBuffer, DecodeError> Decoder<ByteBuffer>::decode(ByteSource& source) {
    const auto len = Decoder<uint32_t>::decode(source);
    if (!len) {
        return std::unexpected(len.error());
    }
    // InvalidInput here: the whole buffer is allocated eagerly
    if (*len > source.remaining()) {
        spdlog::error("byte buffer length exceeds remaining input (len: {}, remaining: {})", *len,
                      source.remaining());
        return std::unexpected(
            DecodeError{ErrorKind::InvalidInput,
                        "Cannot allocate more bytes then we have in remaining input"});
    }

    auto result = ByteBuffer{std::vector<uint8_t>(*len)};
    if (auto res = source.read(result.bytes); !res) {
        return std::unexpected(res.error());
    }
    return result;
}

}  // namespace borsh
