#pragma once
#include <cstddef>

namespace borsh {

constexpr size_t DEFAULT_MAX_DEPTH = 128;

struct DecoderConfig {
    // nested composites (optional, sequence, map, array, tuple...) beyond this fail
    size_t max_depth{DEFAULT_MAX_DEPTH};
    // bool and optional flag bytes must be exactly 0 or 1
    bool strict_flags{false};

    static DecoderConfig from_env();
    void validate() const;
};

}  // namespace borsh
