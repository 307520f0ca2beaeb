// Main entry: parse CLI, run the selected majority-illusion experiment
#include <iostream>
#include <string>

#include "app/app.hpp"
#include "cli/cli.hpp"
#include "core/errors.hpp"

int main(int argc, char** argv) {
    bool want_help = false; std::string help_text;
    cli::Options opt;
    try {
        opt = cli::parse_args(argc, argv, want_help, help_text);
    } catch (const cli::ParseError& e) {
        std::cerr << "ERROR: " << e.what() << "\n" << help_text;
        return 2;
    }
    if (want_help) { std::cout << help_text; return 0; }

    try {
        return app::run_app(opt);
    } catch (const core::precondition_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}
