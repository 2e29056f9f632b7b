#include "utf8.h"

namespace borsh {

static bool is_continuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at data[pos], or 0 if there is none.
static size_t sequence_length(std::span<const uint8_t> data, size_t pos) {
    const uint8_t lead = data[pos];
    const size_t avail = data.size() - pos;

    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return avail >= 2 && is_continuation(data[pos + 1]) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (avail < 3) {
            return 0;
        }
        const uint8_t second = data[pos + 1];
        // E0 needs A0..BF (no overlongs), ED needs 80..9F (no surrogates)
        const uint8_t lo = lead == 0xE0 ? 0xA0 : 0x80;
        const uint8_t hi = lead == 0xED ? 0x9F : 0xBF;
        if (second < lo || second > hi || !is_continuation(data[pos + 2])) {
            return 0;
        }
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (avail < 4) {
            return 0;
        }
        const uint8_t second = data[pos + 1];
        // F0 needs 90..BF (no overlongs), F4 needs 80..8F (<= U+10FFFF)
        const uint8_t lo = lead == 0xF0 ? 0x90 : 0x80;
        const uint8_t hi = lead == 0xF4 ? 0x8F : 0xBF;
        if (second < lo || second > hi || !is_continuation(data[pos + 2]) ||
            !is_continuation(data[pos + 3])) {
            return 0;
        }
        return 4;
    }
    return 0;
}

std::optional<size_t> Utf8::find_invalid(std::span<const uint8_t> data) {
    size_t pos = 0;
    while (pos < data.size()) {
        const auto len = sequence_length(data, pos);
        if (len == 0) {
            return pos;
        }
        pos += len;
    }
    return std::nullopt;
}

}  // namespace borsh
