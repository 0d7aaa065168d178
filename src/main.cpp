#include <iostream>
#include <vector>
#include <string>
#include "cli/env_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        for (const auto& arg : args) {
            if (arg == "--version") {
                std::cout << theme::color::ACCENT << theme::color::BOLD << "ocenv"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << OCENV_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
        }

        EnvOptions opts;
        try {
            opts = EnvCLI::parse_args(args);
        } catch (const UsageError& e) {
            std::cerr << theme::fail(e.what());
            print_usage();
            return 1;
        }

        EnvCLI cli;
        return cli.run(opts);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
