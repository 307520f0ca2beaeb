#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>
#include <vector>

namespace core {

// SplitMix64: small, fast engine used for every random draw in a trial.
// Satisfies UniformRandomBitGenerator so it also plugs into <random>.
struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    inline std::uint64_t next_u64() noexcept {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() noexcept { return next_u64(); }

    inline double next_unit_double() noexcept {
        // 53-bit mantissa
        const std::uint64_t r = next_u64();
        return (r >> 11) * (1.0 / (1ull << 53));
    }
};

inline std::uint64_t splitmix_hash(std::uint64_t x) noexcept {
    SplitMix64 sm(x);
    return sm.next_u64();
}

// ---------------- Random utilities ----------------

// Unbiased mapping of a 64-bit URBG output to [0, n) using Lemire's
// multiply-high method with a tiny rejection loop.
// Precondition: n > 0.
template <class URBG>
inline std::uint64_t uniform_bounded(URBG& rng, std::uint64_t n) noexcept {
    using u128 = unsigned __int128;
    std::uint64_t x = rng();
    u128 m = (u128)x * (u128)n;
    std::uint64_t l = (std::uint64_t)m;
    if (l < n) {
        const std::uint64_t t = (-n) % n;
        while (l < t) { x = rng(); m = (u128)x * (u128)n; l = (std::uint64_t)m; }
    }
    return (std::uint64_t)(m >> 64);
}

// Draw k distinct indices from [0, n) with Floyd's algorithm. Uses a local
// mark vector instead of scans; the result is in draw order.
// Precondition: k <= n.
template <class URBG>
inline std::vector<std::size_t> sample_without_replacement(std::size_t n, std::size_t k, URBG& rng) {
    std::vector<std::size_t> out;
    out.reserve(k);
    if (k == 0) return out;
    std::vector<unsigned char> taken(n, 0);
    for (std::size_t j = n - k; j < n; ++j) {
        const std::size_t t = static_cast<std::size_t>(uniform_bounded(rng, static_cast<std::uint64_t>(j + 1)));
        const std::size_t pick = taken[t] ? j : t;
        taken[pick] = 1;
        out.push_back(pick);
    }
    return out;
}

// Seed J jobs deterministically using the master RNG (no races)
template <class SeedRng>
inline std::vector<std::uint64_t> seed_jobs(std::size_t J, SeedRng& master_rng) {
    std::vector<std::uint64_t> seeds(J);
    for (std::size_t i = 0; i < J; ++i) seeds[i] = splitmix_hash(master_rng());
    return seeds;
}

} // namespace core
