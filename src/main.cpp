#include <iostream>
#include <vector>
#include <string>
#include "cli/arrayprep_cli.hpp"
#include "cli/theme.hpp"

static const char* VERSION = "0.1.0";

void print_usage(const ArrayPrepCLI& cli) {
    std::cout << "\n" << theme::color::BLUE << theme::color::BOLD
              << "  arrayprep" << theme::color::RESET << theme::color::DIM
              << "  plan, script and validate job-array batch runs"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    arrayprep --version     Show version\n"
              << "    arrayprep --help        Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        ArrayPrepCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << "arrayprep " << VERSION << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
