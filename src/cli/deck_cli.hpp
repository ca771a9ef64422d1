#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

#define SSHDECK_VERSION "0.1.0"

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);
void register_forward_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);

class DeckCLI : public BaseCLI {
public:
    DeckCLI();

    void run_repl();

    // Write the default config; reports if one already exists.
    static void run_init();

private:
    void register_all_commands();
};
