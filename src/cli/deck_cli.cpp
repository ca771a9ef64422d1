#include "deck_cli.hpp"
#include "terminal_output.hpp"
#include "theme.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <core/config.hpp>
#include <core/log.hpp>
#include <readline/readline.h>
#include <readline/history.h>

DeckCLI::DeckCLI() : BaseCLI() {
    register_all_commands();
}

void DeckCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Close every connection and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Close every connection and exit");

    register_connection_commands(*this);
    register_session_commands(*this);
    register_forward_commands(*this);
    register_file_commands(*this);
}

void DeckCLI::run_init() {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists: " + get_global_config_path().string());
        return;
    }
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    std::cout << theme::step("Add profiles as <name>.yaml files in the profiles directory.");
}

void DeckCLI::run_repl() {
    std::cout << theme::banner(SSHDECK_VERSION);

    if (!service) return;

    service->set_sink(std::make_shared<TerminalSink>());

    std::cout << theme::kv("Config", global_config_exists()
                                        ? get_global_config_path().string()
                                        : std::string("defaults (run 'sshdeck init')"));
    std::cout << theme::kv("Profiles", config->profiles_dir().string());
    std::cout << theme::kv("Log", sshdeck_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::dim("    Disconnecting...") << "\n";
    service->shutdown();
}
