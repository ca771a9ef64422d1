#include <iostream>
#include <string>
#include "cli/deck_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner(SSHDECK_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    sshdeck"
              << theme::color::RESET << theme::color::DIM
              << "                 Enter the interactive prompt" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    sshdeck init"
              << theme::color::RESET << theme::color::DIM
              << "            Write the default config" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sshdeck --version       Show version\n"
              << "    sshdeck --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc > 1) {
            std::string cmd = argv[1];

            if (cmd == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "sshdeck"
                          << theme::color::RESET << theme::color::DIM
                          << " version " SSHDECK_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            } else if (cmd == "init") {
                DeckCLI::run_init();
                return 0;
            } else {
                std::cout << theme::fail("Unknown command: " + cmd);
                print_usage();
                return 1;
            }
        }

        DeckCLI cli;
        cli.run_repl();
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
