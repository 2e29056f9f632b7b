#include "text.h"

#include <spdlog/spdlog.h>

#include <format>
#include <vector>

#include "utf8.h"

namespace borsh {

std::expected<std::string, DecodeError> Decoder<std::string>::decode(ByteSource& source) {
    const auto prefix = read_length_prefix<uint8_t>(source, "string");
    if (!prefix) {
        return std::unexpected(prefix.error());
    }
    // the length bound guarantees capacity == declared length here
    const auto capacity = prefix->second;

    std::vector<uint8_t> bytes(capacity);
    if (auto res = source.read(bytes); !res) {
        return std::unexpected(res.error());
    }

    if (const auto bad = Utf8::find_invalid(bytes)) {
        spdlog::error("invalid utf-8 in string at byte offset {}", *bad);
        return std::unexpected(DecodeError{
            ErrorKind::InvalidData, std::format("invalid utf-8 sequence from index {}", *bad)});
    }
    return std::string{bytes.begin(), bytes.end()};
}

}  // namespace borsh
