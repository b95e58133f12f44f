#ifndef GD_RNG_RANDOMSOURCE_HPP
#define GD_RNG_RANDOMSOURCE_HPP

#include <bit>
#include <concepts>
#include <cstdint>
#include <limits>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace gd::rng {

/**
 * @brief xoshiro256++ engine (256-bit state), seeded via SplitMix64 to avoid the all-zero fixed point.
 * @see D. Blackman, S. Vigna, "Scrambled Linear Pseudorandom Number Generators", arXiv:1805.01407
 */
struct Xoshiro256pp {
    using result_type = std::uint64_t;

    static constexpr result_type min() noexcept { return 0; }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    std::uint64_t _state[4]{};

    constexpr Xoshiro256pp() noexcept { seed(0); }
    explicit constexpr Xoshiro256pp(std::uint64_t seedValue) noexcept { seed(seedValue); }

    constexpr void seed(std::uint64_t seedValue) noexcept {
        std::uint64_t sm = seedValue;
        for (auto& s : _state) {
            s = splitMix64(sm);
        }
    }

    constexpr result_type operator()() noexcept {
        auto& [s0, s1, s2, s3]     = _state;
        const result_type   result = std::rotl(s0 + s3, 23) + s0;
        const std::uint64_t t      = s1 << 17;
        s2 ^= s0;
        s3 ^= s1;
        s1 ^= s2;
        s0 ^= s3;
        s2 ^= t;
        s3 = std::rotl(s3, 45);
        return result;
    }

    /// uniform in [0, 1) with 53 bits of mantissa
    constexpr double uniform01() noexcept { return static_cast<double>(operator()() >> 11) * 0x1.0p-53; }

private:
    static constexpr std::uint64_t splitMix64(std::uint64_t& x) noexcept {
        std::uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
        z               = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z               = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }
};

static_assert(std::uniform_random_bit_generator<Xoshiro256pp>);

/**
 * @brief the seedable random source threaded through the layout algorithms.
 *
 * There is no global generator: the pipeline reseeds the source with `random seed` before every component and
 * the coarse graph reseeds it with 42 before it expands a vertex, so that layouts are reproducible for a given
 * seed and order of draws.
 */
class RandomSource {
    Xoshiro256pp _engine;

public:
    static constexpr std::uint64_t kExpandSeed = 42U;

    constexpr RandomSource() noexcept : _engine(kExpandSeed) {}
    explicit constexpr RandomSource(std::uint64_t seedValue) noexcept : _engine(seedValue) {}

    constexpr void reseed(std::uint64_t seedValue) noexcept { _engine.seed(seedValue); }

    /// uniform in [0, 1)
    [[nodiscard]] constexpr double random() noexcept { return _engine.uniform01(); }

    /// uniform in [lo, hi)
    [[nodiscard]] constexpr double random(double lo, double hi) noexcept { return lo + (hi - lo) * random(); }

    /// uniform integer in [lo, hi]
    [[nodiscard]] constexpr std::int64_t randomInteger(std::int64_t lo, std::int64_t hi) noexcept {
        if (hi <= lo) {
            return lo;
        }
        const auto span = static_cast<std::uint64_t>(hi - lo) + 1U;
        return lo + static_cast<std::int64_t>(_engine() % span);
    }

    /// random order of `0 .. n-1`
    [[nodiscard]] std::vector<std::size_t> randomPermutation(std::size_t n) {
        std::vector<std::size_t> p(n);
        std::iota(p.begin(), p.end(), 0UZ);
        for (std::size_t i = 0UZ; i + 1UZ < n; ++i) {
            const auto j = static_cast<std::size_t>(randomInteger(static_cast<std::int64_t>(i), static_cast<std::int64_t>(n - 1UZ)));
            std::swap(p[i], p[j]);
        }
        return p;
    }

    [[nodiscard]] Xoshiro256pp& engine() noexcept { return _engine; }
};

} // namespace gd::rng

#endif // GD_RNG_RANDOMSOURCE_HPP
