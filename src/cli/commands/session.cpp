#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

static void print_error(const std::string& error, ErrorKind kind) {
    std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(kind), error));
}

// "exec [@profile] <command>"; "!name" expands a synonym.
static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    std::string command = trimmed(arg);
    std::string target;
    if (!command.empty() && command[0] == '@') {
        auto space = command.find(' ');
        target = command.substr(1, space == std::string::npos ? std::string::npos : space - 1);
        command = space == std::string::npos ? "" : trimmed(command.substr(space));
    }
    if (command.empty()) {
        std::cout << "Usage: exec [@profile] <command>\n";
        return;
    }

    auto profile = cli.resolve_profile(target);
    if (!profile) return;

    if (command[0] == '!') {
        auto expanded = cli.service->resolve_synonym(command.substr(1));
        if (!expanded) {
            std::cout << theme::fail("Unknown alias: " + command.substr(1));
            return;
        }
        std::cout << theme::dim("    " + *expanded) << "\n";
        command = *expanded;
    }

    auto result = cli.service->execute(*profile, command);
    if (result.is_err()) print_error(result.error, result.kind);
}

static void do_stop(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;

    auto result = cli.service->stop(*profile);
    if (result.is_err()) print_error(result.error, result.kind);
}

static void do_history(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;

    auto entries = cli.service->history(*profile);
    if (entries.is_err()) {
        print_error(entries.error, entries.kind);
        return;
    }
    std::cout << theme::section("History: " + *profile);
    if (entries.value.empty()) {
        std::cout << theme::dim("    Empty") << "\n\n";
        return;
    }
    for (size_t i = 0; i < entries.value.size(); i++) {
        std::cout << theme::dim(fmt::format("    {:>3}  ", i + 1)) << entries.value[i] << "\n";
    }
    std::cout << "\n";
}

static void do_alias(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    std::string command = trimmed(arg);
    if (command.empty()) {
        std::cout << "Usage: alias <command>\n";
        return;
    }

    auto synonym = cli.service->create_synonym(command);
    if (synonym.is_err()) {
        print_error(synonym.error, synonym.kind);
        return;
    }
    if (synonym.value.empty()) {
        std::cout << theme::info("Single-word commands get no alias.");
        return;
    }
    std::cout << theme::ok(fmt::format("!{}  ->  {}", synonym.value, command));
}

// ── Saved commands ──────────────────────────────────────────

// "save <name> <command>"
static void do_save(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    std::string line = trimmed(arg);
    auto space = line.find(' ');
    if (space == std::string::npos) {
        std::cout << "Usage: save <name> <command>\n";
        return;
    }
    std::string name = line.substr(0, space);
    std::string command = trimmed(line.substr(space));

    auto result = cli.service->save_command(name, command);
    if (result.is_err()) {
        print_error(result.error, result.kind);
        return;
    }
    std::cout << theme::ok(fmt::format("Saved '{}'", name));
}

static void do_saved(BaseCLI& cli, const std::string&) {
    if (!cli.require_service()) return;
    auto commands = cli.service->saved_commands();
    if (commands.is_err()) {
        print_error(commands.error, commands.kind);
        return;
    }
    std::cout << theme::section("Saved commands");
    if (commands.value.empty()) {
        std::cout << theme::dim("    None. Add one with: save <name> <command>") << "\n\n";
        return;
    }
    for (const auto& cmd : commands.value) {
        std::cout << theme::kv(cmd.name, cmd.command);
    }
    std::cout << "\n";
}

static void do_unsave(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    std::string name = trimmed(arg);
    if (name.empty()) {
        std::cout << "Usage: unsave <name>\n";
        return;
    }

    auto result = cli.service->delete_saved(name);
    if (result.is_err()) {
        print_error(result.error, result.kind);
        return;
    }
    std::cout << theme::ok(fmt::format("Removed '{}'", name));
}

// "run-saved <name> [profile]"
static void do_run_saved(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto args = split_args(arg);
    if (args.empty()) {
        std::cout << "Usage: run-saved <name> [profile]\n";
        return;
    }

    auto profile = cli.resolve_profile(args.size() > 1 ? args[1] : "");
    if (!profile) return;

    auto result = cli.service->execute_saved(*profile, args[0]);
    if (result.is_err()) {
        print_error(result.error, result.kind);
        return;
    }
    std::cout << theme::dim("    " + result.value) << "\n";
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command on the current profile ([@profile] <command>)");
    cli.add_command("run", do_exec, "Same as exec");
    cli.add_command("stop", do_stop, "Interrupt the running command");
    cli.add_command("history", do_history, "Show command history, newest first");
    cli.add_command("alias", do_alias, "Create a short alias for a command (use as !alias)");
    cli.add_command("save", do_save, "Save a named command (<name> <command>)");
    cli.add_command("saved", do_saved, "List saved commands");
    cli.add_command("unsave", do_unsave, "Delete a saved command");
    cli.add_command("run-saved", do_run_saved, "Run a saved command (<name> [profile])");
}
