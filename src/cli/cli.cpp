// cli.cpp — Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cli {

static inline std::optional<std::pair<std::uint64_t,std::uint64_t>> parse_pq(std::string_view s) {
    auto pos = s.find('/');
    if (pos == std::string_view::npos) return std::nullopt;
    std::string_view sp = s.substr(0, pos);
    std::string_view sq = s.substr(pos + 1);
    std::uint64_t p=0, q=0;
    auto to_u64 = [](std::string_view x, std::uint64_t& out)->bool{
        const char* b = x.data();
        const char* e = b + x.size();
        auto res = std::from_chars(b, e, out); return res.ec == std::errc{} && res.ptr == e;
    };
    if (!to_u64(sp, p) || !to_u64(sq, q) || q == 0) return std::nullopt;
    return std::make_pair(p,q);
}

std::optional<core::PqThreshold> parse_threshold(const std::string& s) {
    if (auto pq = parse_pq(std::string_view(s))) {
        core::PqThreshold t(pq->first, pq->second);
        if (!t.valid()) return std::nullopt;
        return t;
    }
    char* endp = nullptr;
    const double d = std::strtod(s.c_str(), &endp);
    if (s.empty() || !endp || *endp != '\0' || !(d >= 0.0 && d <= 1.0)) return std::nullopt;
    const core::count_t q = 1000000ULL;
    return core::PqThreshold(static_cast<core::count_t>(std::llround(d * static_cast<double>(q))), q);
}

static Mode parse_mode(const std::string& s) {
    if (s == "single")   return Mode::Single;
    if (s == "scenario") return Mode::Scenario;
    if (s == "batch")    return Mode::Batch;
    throw ParseError("--mode must be single, scenario or batch (got '" + s + "')");
}

Options parse_args(int argc, const char* const* argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string mode_s;
    std::string phi_s;
    std::string rule_s;
    std::vector<double> fractions;

    cxxopts::Options desc("illusion", "Majority illusion on Barabási–Albert networks");
    desc.add_options()
        ("h,help", "Show this help")
        ("mode", "single | scenario | batch", cxxopts::value<std::string>(mode_s)->default_value("batch"))
        ("n,nodes", "Number of nodes", cxxopts::value<std::size_t>(opt.nodes)->default_value("1000"))
        ("m,attach", "Edges per new node (BA parameter)", cxxopts::value<std::size_t>(opt.attach)->default_value("2"))
        ("phi", "Adoption threshold as p/q or decimal (threshold rule)", cxxopts::value<std::string>(phi_s)->default_value("1/2"))
        ("r,rule", "threshold | majority (default: threshold for single, majority otherwise)", cxxopts::value<std::string>(rule_s))
        ("max-rounds", "Round cap per diffusion run", cxxopts::value<std::size_t>(opt.max_rounds)->default_value("50"))
        ("cycle-window", "Stop on a labeling repeated within this many rounds (0 = off)", cxxopts::value<std::size_t>(opt.cycle_window)->default_value("0"))
        ("f,fractions", "Minority fractions, comma separated", cxxopts::value<std::vector<double>>(fractions)->default_value("0.10,0.30,0.40"))
        ("t,trials", "Number of batch trials", cxxopts::value<std::size_t>(opt.trials)->default_value("200"))
        ("seed", "Master random seed", cxxopts::value<std::uint64_t>(opt.seed)->default_value("42"))
        ("threads", "Worker threads for batch mode (0 = all cores)", cxxopts::value<int>(opt.threads)->default_value("1"))
        ("progress", "Show a progress bar in batch mode", cxxopts::value<bool>(opt.progress)->default_value("false"))
    ;
    help_text = desc.help();

    try {
        auto result = desc.parse(argc, argv);
        if (result.count("help")) { want_help = true; return opt; }
        if (result.count("rule")) {
            auto k = sim::parse_rule(rule_s);
            if (!k) throw ParseError("--rule must be threshold or majority (got '" + rule_s + "')");
            opt.rule = *k;
        }
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(e.what());
    }

    opt.mode = parse_mode(mode_s);

    auto phi = parse_threshold(phi_s);
    if (!phi) throw ParseError("--phi must be p/q or a decimal in [0,1] (got '" + phi_s + "')");
    opt.phi = *phi;

    if (opt.attach < 1 || opt.nodes <= opt.attach) throw ParseError("need --nodes > --attach >= 1");
    if (opt.max_rounds < 1) throw ParseError("--max-rounds must be >= 1");
    if (opt.trials < 1) throw ParseError("--trials must be >= 1");
    if (opt.threads < 0) throw ParseError("--threads must be >= 0");
    if (fractions.empty()) throw ParseError("--fractions must list at least one value");
    for (double f : fractions) {
        if (!(f >= 0.0 && f <= 1.0)) throw ParseError("--fractions values must be in [0,1]");
    }
    opt.fractions = std::move(fractions);
    return opt;
}

} // namespace cli
