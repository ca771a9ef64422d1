#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>
#include <core/log.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        std::cout << theme::step("Fix " + get_global_config_path().string() + " or remove it to use defaults.");
        return;
    }
    config = config_result.value;
    set_log_path(config->log_file());
    service = std::make_unique<DeckService>(config.value());
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_service() {
    if (!service) {
        std::cout << theme::fail("No usable configuration.");
        return false;
    }
    return true;
}

std::optional<std::string> BaseCLI::resolve_profile(const std::string& arg) {
    if (!arg.empty()) return arg;
    if (!current_profile.empty()) return current_profile;
    std::cout << theme::fail("No profile selected.");
    std::cout << theme::step("Run 'connect <profile>' first.");
    return std::nullopt;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        sshdeck_log(fmt::format("CLI: '{}' threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connections", {"profiles", "connect", "disconnect", "active"}},
        {"Commands",    {"exec", "run", "stop", "history", "alias",
                         "save", "saved", "unsave", "run-saved"}},
        {"Forwarding",  {"forward", "unforward", "forwards"}},
        {"Files",       {"put", "get", "ls", "rm", "mv", "mkdir"}},
        {"General",     {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::TEAL) + "sshdeck" + rl_esc(theme::color::RESET);
    if (!current_profile.empty()) {
        prompt += ":" + rl_esc(theme::color::AMBER) + current_profile + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
