#ifndef GD_OPTIONS_HPP
#define GD_OPTIONS_HPP

#include <concepts>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <pmtv/pmt.hpp>

#include <gd/Coordinate.hpp>
#include <gd/Error.hpp>
#include <gd/Export.hpp>

namespace gd {

using property_map = pmtv::map_t;

inline void updateMaps(const property_map& src, property_map& dest) {
    for (const auto& [key, value] : src) {
        if (auto nested_map = std::get_if<pmtv::map_t>(&value)) {
            if (auto it = dest.find(key); it != dest.end()) {
                if (auto dest_nested_map = std::get_if<pmtv::map_t>(&(it->second))) {
                    updateMaps(*nested_map, *dest_nested_map);
                } else {
                    dest[key] = value;
                }
            } else {
                dest.insert({key, value});
            }
        } else {
            dest[key] = value;
        }
    }
}

namespace options {

namespace detail {
template<typename T>
concept Number = std::is_arithmetic_v<T> && !std::same_as<T, bool>;
} // namespace detail

/// typed access to an option; numbers convert into each other, everything else has to match exactly
template<typename T>
[[nodiscard]] std::expected<T, Error> get(const property_map& map, std::string_view key) {
    auto it = map.find(key);
    if (it == map.cend()) {
        return std::unexpected(Error(fmt::format("missing option '{}'", key)));
    }
    return std::visit(
        [&key]<typename TValue>(const TValue& value) -> std::expected<T, Error> {
            if constexpr (std::same_as<TValue, T>) {
                return value;
            } else if constexpr (detail::Number<T> && detail::Number<TValue>) {
                return static_cast<T>(value);
            } else if constexpr (std::same_as<T, std::vector<double>> && std::same_as<TValue, std::vector<float>>) {
                return std::vector<double>(value.begin(), value.end());
            } else {
                return std::unexpected(Error(fmt::format("option '{}' has an incompatible type", key)));
            }
        },
        it->second);
}

template<typename T>
[[nodiscard]] T value(const property_map& map, std::string_view key, T fallback) {
    auto result = get<T>(map, key);
    return result ? *result : fallback;
}

/// option value that has to be present, e.g. one that `defaults()` provides
template<typename T>
[[nodiscard]] T required(const property_map& map, std::string_view key, std::source_location location = std::source_location::current()) {
    return getOrThrow(get<T>(map, key), location);
}

[[nodiscard]] inline bool contains(const property_map& map, std::string_view key) { return map.find(key) != map.cend(); }

/// coordinates are stored as `std::vector<double>{x, y}`
[[nodiscard]] inline std::expected<Coordinate, Error> coordinate(const property_map& map, std::string_view key) {
    auto vec = get<std::vector<double>>(map, key);
    if (!vec) {
        return std::unexpected(vec.error());
    }
    if (vec->size() != 2UZ) {
        return std::unexpected(Error(fmt::format("option '{}' is not a coordinate (size {})", key, vec->size())));
    }
    return Coordinate{(*vec)[0], (*vec)[1]};
}

[[nodiscard]] inline pmtv::pmt toValue(const Coordinate& c) { return std::vector<double>{c.x, c.y}; }

/// the initial value of every option key the layout engine recognises
GD_EXPORT const property_map& defaults();

/// merges the given option layers (first = lowest priority) on top of `defaults()`
[[nodiscard]] inline property_map resolve(std::initializer_list<const property_map*> layers) {
    property_map result = defaults();
    for (const property_map* layer : layers) {
        if (layer != nullptr) {
            updateMaps(*layer, result);
        }
    }
    return result;
}

} // namespace options
} // namespace gd

#endif // GD_OPTIONS_HPP
