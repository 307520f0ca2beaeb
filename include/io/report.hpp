// report.hpp — plain-text console output for runs and batch tables
#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "experiment/aggregator.hpp"
#include "experiment/trial.hpp"
#include "graphs/influencers.hpp"
#include "sim/opinions.hpp"

namespace io {

// Label name, wrapped in its ANSI color when `color` is set.
std::string label_text(sim::Label l, bool color);

// "10%" style header for a fraction.
std::string percent(double fraction);

void print_selection(std::ostream& os, const graphs::InfluencerSelection& sel);
void print_single(std::ostream& os, const experiment::ScenarioResult& s, bool color);
void print_scenario(std::ostream& os, const experiment::ScenarioResult& s, bool color);
void print_table(std::ostream& os, const experiment::SummaryTable& t);
void print_failures(std::ostream& os, const std::vector<experiment::TrialFailure>& failures);

} // namespace io
