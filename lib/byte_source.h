#pragma once
#include <cstdint>
#include <expected>
#include <span>

#include "decode_error.h"
#include "decoder_config.h"

namespace borsh {

class ByteSource;

// Holds one level of nesting on a ByteSource for as long as it lives.
class NestingGuard {
   public:
    explicit NestingGuard(ByteSource& source) : source_(&source) {}

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

    NestingGuard(NestingGuard&& other) noexcept : source_(other.source_) {
        other.source_ = nullptr;
    }
    NestingGuard& operator=(NestingGuard&&) = delete;

    ~NestingGuard();

   private:
    ByteSource* source_;
};

class ByteSource {
   public:
    explicit ByteSource(std::span<const uint8_t> data, const DecoderConfig& config = {})
        : data_(data), pos_(0), config_(config) {}

    ByteSource(const ByteSource&) = delete;
    ByteSource& operator=(const ByteSource&) = delete;

    ByteSource(ByteSource&&) = default;
    ByteSource& operator=(ByteSource&&) = default;

    // Fills buf completely, or fails with UnexpectedEof leaving the cursor untouched.
    std::expected<void, DecodeError> read(std::span<uint8_t> buf);
    std::expected<uint8_t, DecodeError> read_byte();
    [[nodiscard]] size_t remaining() const;

    [[nodiscard]] const DecoderConfig& config() const {
        return config_;
    }

    [[nodiscard]] size_t depth() const {
        return depth_;
    }

    std::expected<NestingGuard, DecodeError> enter_nested();

   private:
    friend class NestingGuard;

    std::span<const uint8_t> data_;
    size_t pos_;
    size_t depth_{};
    DecoderConfig config_;
};

}  // namespace borsh
