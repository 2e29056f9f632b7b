#include "decoder_config.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace borsh {

static size_t parse_depth(std::string_view value) {
    size_t depth{};
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        throw std::invalid_argument("BORSH_MAX_DEPTH is not a number: " + std::string(value));
    }
    return depth;
}

static bool parse_flag(std::string_view value) {
    if (value == "1" || value == "true") {
        return true;
    }
    if (value == "0" || value == "false") {
        return false;
    }
    throw std::invalid_argument("BORSH_STRICT_FLAGS must be one of 1, true, 0, false: " +
                                std::string(value));
}

DecoderConfig DecoderConfig::from_env() {
    const char* max_depth = std::getenv("BORSH_MAX_DEPTH");
    const char* strict_flags = std::getenv("BORSH_STRICT_FLAGS");

    auto config = DecoderConfig{};
    if (max_depth) {
        config.max_depth = parse_depth(max_depth);
    }
    if (strict_flags) {
        config.strict_flags = parse_flag(strict_flags);
    }
    spdlog::debug("decoder config from env (max depth: {}, strict flags: {})", config.max_depth,
                  config.strict_flags);
    return config;
}

void DecoderConfig::validate() const {
    if (max_depth == 0) {
        throw std::invalid_argument("max_depth must be at least 1");
    }
}

}  // namespace borsh
