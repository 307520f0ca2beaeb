// app.hpp — run the selected mode for parsed options
#pragma once

#include "cli/cli.hpp"

namespace app {

// Returns the process exit code. Engine precondition failures propagate as
// core::precondition_error.
int run_app(const cli::Options& opt);

} // namespace app
