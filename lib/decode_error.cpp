#include "decode_error.h"

#include <format>
#include <utility>

namespace borsh {

std::string_view ErrorKindHelper::to_string(const ErrorKind& kind) {
    switch (kind) {
        case ErrorKind::UnexpectedEof:
            return "unexpected end of input";
        case ErrorKind::InvalidData:
            return "invalid data";
        case ErrorKind::InvalidInput:
            return "invalid input";
        default:
            return "unknown";
    }
}

std::string DecodeError::to_string() const {
    return std::format("{}: {}", ErrorKindHelper::to_string(kind), message);
}

DecodeException::DecodeException(DecodeError error)
    : std::runtime_error(error.to_string()), error_(std::move(error)) {}

}  // namespace borsh
