#include "../base_cli.hpp"
#include "../theme.hpp"
#include <algorithm>
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

static void do_profiles(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto profiles = cli.service->profiles();

    std::cout << theme::section("Profiles");
    if (profiles.empty()) {
        std::cout << theme::dim("    No profiles in " + cli.config->profiles_dir().string()) << "\n\n";
        return;
    }
    auto active = cli.service->active_connections();
    for (const auto& p : profiles) {
        bool up = std::find(active.begin(), active.end(), p.name) != active.end();
        std::string target = fmt::format("{}@{}:{}", p.username, p.host, p.port);
        std::string auth = p.ssh_key_path ? "key" : "password";
        std::cout << theme::kv(p.name, target + theme::dim("  " + auth)
                               + (up ? "  " + theme::teal("connected") : ""));
    }
    std::cout << "\n";
}

static void do_connect(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    std::string name = trimmed(arg);
    if (name.empty()) {
        std::cout << "Usage: connect <profile>\n";
        return;
    }

    std::cout << theme::dim("    Connecting to " + name + "...") << "\n";
    auto result = cli.service->connect(name);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(result.kind), result.error));
        return;
    }
    cli.current_profile = name;
    std::cout << theme::ok("Connected to " + name);
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;

    cli.service->disconnect(*profile);
    if (cli.current_profile == *profile) cli.current_profile.clear();
    std::cout << theme::ok("Disconnected " + *profile);
}

static void do_active(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto active = cli.service->active_connections();

    std::cout << theme::section("Active connections");
    if (active.empty()) {
        std::cout << theme::dim("    None") << "\n\n";
        return;
    }
    for (const auto& name : active) {
        std::string state = session_state_name(cli.service->session_state(name));
        size_t forwards = cli.service->list_forwards(name).size();
        std::cout << theme::kv(name, fmt::format("{}  {} forward(s)", state, forwards));
    }
    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("profiles", do_profiles, "List configured profiles");
    cli.add_command("connect", do_connect, "Connect to a profile and make it current");
    cli.add_command("disconnect", do_disconnect, "Stop commands and forwards, close the connection");
    cli.add_command("active", do_active, "List open connections");
}
