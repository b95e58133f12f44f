#ifndef GD_META_UTILS_HPP
#define GD_META_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gd::meta {

template<typename... Lambdas>
struct overloaded : Lambdas... {
    using Lambdas::operator()...;
};

template<typename... Lambdas>
overloaded(Lambdas...) -> overloaded<Lambdas...>;

/**
 * @brief strongly typed index into an arena: `enum class VertexId : std::uint32_t {}` style handles are converted
 * to and from plain indices via these helpers.
 */
template<typename TId>
requires std::is_enum_v<TId>
[[nodiscard]] constexpr std::size_t index(TId id) noexcept {
    return static_cast<std::size_t>(std::to_underlying(id));
}

template<typename TId>
requires std::is_enum_v<TId>
[[nodiscard]] constexpr TId makeId(std::size_t index) noexcept {
    return static_cast<TId>(static_cast<std::underlying_type_t<TId>>(index));
}

constexpr void hashCombine(std::size_t& seed, std::size_t value) noexcept { seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2); }

template<typename TFirst, typename TSecond>
struct PairHash {
    [[nodiscard]] std::size_t operator()(const std::pair<TFirst, TSecond>& pair) const noexcept {
        std::size_t seed = std::hash<TFirst>{}(pair.first);
        hashCombine(seed, std::hash<TSecond>{}(pair.second));
        return seed;
    }
};

} // namespace gd::meta

#endif // GD_META_UTILS_HPP
