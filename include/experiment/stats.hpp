// stats.hpp — streaming mean / sample standard deviation
#pragma once
#include <cmath>
#include <cstddef>

namespace experiment {

struct Summary {
    std::size_t n{0};
    double mean{0.0};
    double sd{0.0};     // sample sd (n-1); 0 when n < 2
};

// Welford accumulator. Identical inputs keep M2 at exactly 0.
struct RunningStats {
    std::size_t n{0};
    double mean{0.0};
    double m2{0.0};

    inline void add(double x) noexcept {
        ++n;
        const double d = x - mean;
        mean += d / static_cast<double>(n);
        m2 += d * (x - mean);
    }

    [[nodiscard]] double variance() const noexcept {
        return n < 2 ? 0.0 : m2 / static_cast<double>(n - 1);
    }
    [[nodiscard]] double sd() const noexcept { return std::sqrt(variance()); }
    [[nodiscard]] Summary summary() const noexcept { return Summary{n, mean, sd()}; }
};

} // namespace experiment
