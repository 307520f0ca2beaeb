// report.cpp — console formatting for single runs, scenarios and batch tables

#include "io/report.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include "core/config.hpp"
#include "sim/diffusion.hpp"

namespace io {

std::string label_text(sim::Label l, bool color) {
    std::string name(sim::label_name(l));
    if (!color) return name;
    const char* c = (l == sim::Label::Minority) ? core::config::col1 : core::config::col0;
    return std::string(c) + name + core::config::reset;
}

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::llround(fraction * 100.0) << "%";
    return oss.str();
}

void print_selection(std::ostream& os, const graphs::InfluencerSelection& sel) {
    os << std::fixed << std::setprecision(2)
       << "Average degree = " << sel.mean_degree << ", threshold = " << sel.threshold << "\n"
       << "Number of influencers: " << sel.size() << "\n";
    os.unsetf(std::ios::floatfield);
}

static void print_series(std::ostream& os, const std::vector<std::size_t>& series) {
    os << "Illusion series:";
    for (std::size_t x : series) os << ' ' << x;
    os << "\n";
}

void print_single(std::ostream& os, const experiment::ScenarioResult& s, bool color) {
    print_selection(os, s.influencers);
    os << "Global majority: " << label_text(s.static_report.global, color)
       << ", Illusioned nodes: " << s.static_report.size() << "\n";
    print_series(os, s.diffusion.illusion_series);
    os << "Final number under illusion: " << s.diffusion.final_illusion()
       << " (" << s.diffusion.rounds() << " rounds, "
       << sim::halt_name(s.diffusion.halt) << ")\n";
}

void print_scenario(std::ostream& os, const experiment::ScenarioResult& s, bool color) {
    const std::string frac = s.fraction ? percent(*s.fraction) : std::string("infl");
    os << frac << " | infl=" << s.influencers.size()
       << " | global maj=" << label_text(s.static_report.global, color) << "\n"
       << "  static=" << s.static_report.size()
       << " | peak=" << s.diffusion.peak_illusion()
       << " | final=" << s.diffusion.final_illusion()
       << " | rounds=" << s.diffusion.rounds()
       << " (" << sim::halt_name(s.diffusion.halt) << ")\n";
}

static std::string cell_text(const experiment::Summary& sm) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%6.1f±%-5.1f", sm.mean, sm.sd);
    return buf;
}

void print_table(std::ostream& os, const experiment::SummaryTable& t) {
    std::ostringstream head;
    head << "Infl";
    for (double f : t.fractions) {
        const std::string p = percent(f);
        head << " | " << std::setw(12) << std::left << (p + " stat")
             << " | " << std::setw(12) << std::left << (p + " fin");
    }
    const std::string h = head.str();
    os << h << "\n" << std::string(h.size(), '-') << "\n";

    for (const auto& row : t.rows) {
        os << std::setw(4) << std::right << row.influencer_count;
        for (const auto& cell : row.cells) {
            if (!cell) { os << " | " << std::setw(12) << std::left << "   -" << " | " << std::setw(12) << "   -"; continue; }
            os << " | " << cell_text(cell->static_count) << " | " << cell_text(cell->final_count);
        }
        os << std::right << "\n";
    }
}

void print_failures(std::ostream& os, const std::vector<experiment::TrialFailure>& failures) {
    for (const auto& f : failures) {
        os << "WARN: trial " << f.trial << " failed: " << f.message << "\n";
    }
}

} // namespace io
