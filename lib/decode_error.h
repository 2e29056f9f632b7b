#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace borsh {

enum class ErrorKind { UnexpectedEof, InvalidData, InvalidInput };

class ErrorKindHelper {
   public:
    static std::string_view to_string(const ErrorKind& kind);
};

struct DecodeError {
    ErrorKind kind;
    std::string message;

    std::string to_string() const;

    bool operator==(const DecodeError&) const = default;
};

class DecodeException : public std::runtime_error {
   public:
    explicit DecodeException(DecodeError error);

    const DecodeError& error() const noexcept {
        return error_;
    }

   private:
    DecodeError error_;
};

}  // namespace borsh
