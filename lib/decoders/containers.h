#pragma once
#include <spdlog/spdlog.h>

#include <array>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../decoder.h"
#include "length_prefix.h"
#include "scalar.h"

namespace borsh {

// Invokes decode_at(integral_constant<I>) for each index in order, stopping at the first failure.
template <typename DecodeAt, size_t... Is>
std::expected<void, DecodeError> decode_in_order(DecodeAt&& decode_at,
                                                 std::index_sequence<Is...>) {
    std::expected<void, DecodeError> result{};
    (((result = decode_at(std::integral_constant<size_t, Is>{})), result.has_value()) && ...);
    return result;
}

template <typename T>
struct Decoder<std::optional<T>> {
    static constexpr size_t min_wire_size = 1;

    static std::expected<std::optional<T>, DecodeError> decode(ByteSource& source) {
        const auto flag = read_flag_byte(source, "option");
        if (!flag) {
            return std::unexpected(flag.error());
        }
        if (*flag == 0) {
            return std::optional<T>{};
        }

        auto guard = source.enter_nested();
        if (!guard) {
            return std::unexpected(guard.error());
        }
        auto value = deserialize<T>(source);
        if (!value) {
            return std::unexpected(value.error());
        }
        return std::optional<T>{std::move(*value)};
    }
};

template <typename T>
struct Decoder<std::vector<T>> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<std::vector<T>, DecodeError> decode(ByteSource& source) {
        const auto prefix = read_length_prefix<T>(source, "sequence");
        if (!prefix) {
            return std::unexpected(prefix.error());
        }
        const auto [len, capacity] = *prefix;

        auto guard = source.enter_nested();
        if (!guard) {
            return std::unexpected(guard.error());
        }

        std::vector<T> result;
        result.reserve(capacity);
        for (uint32_t i = 0; i < len; ++i) {
            auto elem = deserialize<T>(source);
            if (!elem) {
                return std::unexpected(elem.error());
            }
            result.push_back(std::move(*elem));
        }
        return result;
    }
};

template <typename Set>
std::expected<Set, DecodeError> decode_set(ByteSource& source) {
    auto elems = Decoder<std::vector<typename Set::value_type>>::decode(source);
    if (!elems) {
        return std::unexpected(elems.error());
    }
    Set result;
    for (auto& elem : *elems) {
        result.insert(std::move(elem));
    }
    return result;
}

template <typename T, typename Hash, typename Eq>
struct Decoder<std::unordered_set<T, Hash, Eq>> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<std::unordered_set<T, Hash, Eq>, DecodeError> decode(
        ByteSource& source) {
        return decode_set<std::unordered_set<T, Hash, Eq>>(source);
    }
};

template <typename T, typename Compare>
struct Decoder<std::set<T, Compare>> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<std::set<T, Compare>, DecodeError> decode(ByteSource& source) {
        return decode_set<std::set<T, Compare>>(source);
    }
};

// A key decoded twice keeps the later value.
template <typename Map>
std::expected<Map, DecodeError> decode_map(ByteSource& source) {
    using K = typename Map::key_type;
    using V = typename Map::mapped_type;

    const auto prefix = read_length_prefix<std::pair<K, V>>(source, "map");
    if (!prefix) {
        return std::unexpected(prefix.error());
    }
    const auto [len, capacity] = *prefix;

    auto guard = source.enter_nested();
    if (!guard) {
        return std::unexpected(guard.error());
    }

    Map result;
    if constexpr (requires(Map& m) { m.reserve(size_t{}); }) {
        result.reserve(capacity);
    }
    for (uint32_t i = 0; i < len; ++i) {
        auto key = deserialize<K>(source);
        if (!key) {
            return std::unexpected(key.error());
        }
        auto value = deserialize<V>(source);
        if (!value) {
            return std::unexpected(value.error());
        }
        result.insert_or_assign(std::move(*key), std::move(*value));
    }
    return result;
}

template <typename K, typename V, typename Hash, typename Eq>
struct Decoder<std::unordered_map<K, V, Hash, Eq>> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<std::unordered_map<K, V, Hash, Eq>, DecodeError> decode(
        ByteSource& source) {
        return decode_map<std::unordered_map<K, V, Hash, Eq>>(source);
    }
};

template <typename K, typename V, typename Compare>
struct Decoder<std::map<K, V, Compare>> {
    static constexpr size_t min_wire_size = LENGTH_PREFIX_SIZE;

    static std::expected<std::map<K, V, Compare>, DecodeError> decode(ByteSource& source) {
        return decode_map<std::map<K, V, Compare>>(source);
    }
};

// Fixed length is part of the type: no prefix on the wire.
template <typename T, size_t N>
struct Decoder<std::array<T, N>> {
    static constexpr size_t min_wire_size = N * min_wire_size_v<T>;

    static std::expected<std::array<T, N>, DecodeError> decode(ByteSource& source) {
        auto guard = source.enter_nested();
        if (!guard) {
            return std::unexpected(guard.error());
        }

        std::array<std::optional<T>, N> parts{};
        auto res = decode_in_order(
            [&]<size_t I>(std::integral_constant<size_t, I>) -> std::expected<void, DecodeError> {
                auto elem = deserialize<T>(source);
                if (!elem) {
                    return std::unexpected(elem.error());
                }
                parts[I].emplace(std::move(*elem));
                return {};
            },
            std::make_index_sequence<N>{});
        if (!res) {
            return std::unexpected(res.error());
        }
        return [&]<size_t... Is>(std::index_sequence<Is...>) {
            return std::array<T, N>{std::move(*parts[Is])...};
        }(std::make_index_sequence<N>{});
    }
};

template <typename... Ts>
struct Decoder<std::tuple<Ts...>> {
    static constexpr size_t min_wire_size = (size_t{0} + ... + min_wire_size_v<Ts>);

    static std::expected<std::tuple<Ts...>, DecodeError> decode(ByteSource& source) {
        auto guard = source.enter_nested();
        if (!guard) {
            return std::unexpected(guard.error());
        }

        std::tuple<std::optional<Ts>...> parts{};
        auto res = decode_in_order(
            [&]<size_t I>(std::integral_constant<size_t, I>) -> std::expected<void, DecodeError> {
                using Component = std::tuple_element_t<I, std::tuple<Ts...>>;
                auto component = deserialize<Component>(source);
                if (!component) {
                    return std::unexpected(component.error());
                }
                std::get<I>(parts).emplace(std::move(*component));
                return {};
            },
            std::index_sequence_for<Ts...>{});
        if (!res) {
            return std::unexpected(res.error());
        }
        return [&]<size_t... Is>(std::index_sequence<Is...>) {
            return std::tuple<Ts...>{std::move(*std::get<Is>(parts))...};
        }(std::index_sequence_for<Ts...>{});
    }
};

template <typename A, typename B>
struct Decoder<std::pair<A, B>> {
    static constexpr size_t min_wire_size = min_wire_size_v<A> + min_wire_size_v<B>;

    static std::expected<std::pair<A, B>, DecodeError> decode(ByteSource& source) {
        auto parts = Decoder<std::tuple<A, B>>::decode(source);
        if (!parts) {
            return std::unexpected(parts.error());
        }
        return std::pair<A, B>{std::move(std::get<0>(*parts)), std::move(std::get<1>(*parts))};
    }
};

}  // namespace borsh
