#pragma once

#include "core/config.hpp"

namespace core {

/**
 * @brief Adoption threshold phi held as p/q.
 * @note Uses cross-multiplication to avoid division in hot paths. Products
 *       are formed in 128 bits, so any 64-bit p/q compares exactly.
 */
struct PqThreshold {
    count_t p{1};
    count_t q{2};
    constexpr PqThreshold() = default;
    constexpr PqThreshold(count_t pp, count_t qq) : p(pp), q(qq) {}

    // true iff agree/neighbors > p/q (strict)
    inline bool exceeded(count_t agree, count_t neighbors) const noexcept {
        using u128 = unsigned __int128;
        return (u128)agree * (u128)q > (u128)neighbors * (u128)p;
    }

    inline double value() const noexcept { return q == 0 ? 0.0 : static_cast<double>(p) / static_cast<double>(q); }
    inline bool valid() const noexcept { return q != 0 && p <= q; }
};

} // namespace core
