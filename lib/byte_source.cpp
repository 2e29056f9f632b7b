#include "byte_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>

namespace borsh {

NestingGuard::~NestingGuard() {
    if (source_) {
        source_->depth_--;
    }
}

std::expected<void, DecodeError> ByteSource::read(std::span<uint8_t> buf) {
    if (buf.size() > remaining()) {
        return std::unexpected(DecodeError{
            ErrorKind::UnexpectedEof,
            std::format("failed to fill whole buffer (wanted: {}, remaining: {})", buf.size(),
                        remaining())});
    }
    std::ranges::copy(data_.subspan(pos_, buf.size()), buf.begin());
    pos_ += buf.size();
    return {};
}

std::expected<uint8_t, DecodeError> ByteSource::read_byte() {
    uint8_t byte{};
    if (auto res = read(std::span{&byte, 1}); !res) {
        return std::unexpected(res.error());
    }
    return byte;
}

size_t ByteSource::remaining() const {
    return data_.size() - pos_;
}

std::expected<NestingGuard, DecodeError> ByteSource::enter_nested() {
    if (depth_ >= config_.max_depth) {
        spdlog::error("maximum nesting depth exceeded (limit: {})", config_.max_depth);
        return std::unexpected(DecodeError{
            ErrorKind::InvalidInput,
            std::format("Maximum nesting depth exceeded (limit: {})", config_.max_depth)});
    }
    depth_++;
    return NestingGuard{*this};
}

}  // namespace borsh
