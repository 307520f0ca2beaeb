// opinions.hpp — binary opinion labeling over all vertices
#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "core/rng.hpp"

namespace sim {

// Color 0 is the majority opinion (Blue), color 1 the minority (Red).
enum class Label : std::uint8_t { Majority = 0, Minority = 1 };

inline constexpr std::string_view label_name(Label l) noexcept {
    return l == Label::Minority ? "Red" : "Blue";
}

/**
 * @brief Total labeling: every vertex carries exactly one Label.
 * @note Counts are kept in sync by set(), so count() is O(1).
 */
class Opinions {
public:
    Opinions() = default;
    explicit Opinions(std::size_t n, Label fill = Label::Majority)
        : labels_(n, fill), minority_(fill == Label::Minority ? n : 0) {}

    [[nodiscard]] std::size_t size() const noexcept { return labels_.size(); }
    [[nodiscard]] Label get(core::index_t v) const noexcept { return labels_[v]; }
    [[nodiscard]] bool is_minority(core::index_t v) const noexcept { return labels_[v] == Label::Minority; }

    inline void set(core::index_t v, Label l) noexcept {
        CORE_ASSERT_H(v < labels_.size(), "Opinions::set: index out of range");
        if (labels_[v] == l) return;
        if (l == Label::Minority) ++minority_; else --minority_;
        labels_[v] = l;
    }

    [[nodiscard]] std::size_t count(Label l) const noexcept {
        return l == Label::Minority ? minority_ : labels_.size() - minority_;
    }

    // 64-bit fingerprint of the whole labeling (order-sensitive)
    [[nodiscard]] std::uint64_t fingerprint() const noexcept {
        std::uint64_t h = core::splitmix_hash(labels_.size());
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            if (labels_[i] == Label::Minority) h = core::splitmix_hash(h ^ static_cast<std::uint64_t>(i));
        }
        return h;
    }

    friend bool operator==(const Opinions& a, const Opinions& b) noexcept { return a.labels_ == b.labels_; }

private:
    std::vector<Label> labels_;
    std::size_t minority_{0};
};

} // namespace sim
