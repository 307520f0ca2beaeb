// cli.hpp — Command-line parsing interface (cxxopts)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/threshold.hpp"
#include "sim/rules.hpp"

namespace cli {

enum class Mode { Single, Scenario, Batch };

struct Options {
    Mode mode = Mode::Batch;

    // Graph: Barabási–Albert with n nodes, m edges per new node
    std::size_t nodes  = core::defaults::nodes;
    std::size_t attach = core::defaults::attach;

    // Adoption threshold phi as p/q (defaults to 1/2)
    core::PqThreshold phi{1, 2};
    std::size_t max_rounds = core::defaults::max_rounds;
    std::size_t cycle_window = 0;

    // Unset => threshold for single, majority vote otherwise
    std::optional<sim::RuleKind> rule;

    std::vector<double> fractions{0.10, 0.30, 0.40};
    std::size_t trials = core::defaults::trials;
    std::uint64_t seed = core::defaults::seed;

    int threads = 1;                 // 0 => tbb default
    bool progress = false;

    [[nodiscard]] sim::RuleKind effective_rule() const noexcept {
        return rule.value_or(mode == Mode::Single ? sim::RuleKind::Threshold : sim::RuleKind::MajorityVote);
    }
};

// Invalid option values (unknown mode/rule, malformed phi, out-of-range numbers).
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parse p/q ("1/2") or a decimal ("0.5") into a threshold in [0,1].
std::optional<core::PqThreshold> parse_threshold(const std::string& s);

// Parse CLI arguments with cxxopts.
// On success, returns filled Options and sets want_help/help_text for --help.
// Throws ParseError on invalid input.
Options parse_args(int argc, const char* const* argv, bool& want_help, std::string& help_text);

} // namespace cli
