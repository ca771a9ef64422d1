#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

// "[-R] <local>:<remote> [profile]"
static std::optional<PortForwardEntry> parse_forward(BaseCLI& cli, const std::string& arg) {
    PortForwardEntry entry;
    entry.direction = ForwardDirection::LocalToRemote;
    std::string ports;
    std::string target;

    for (const auto& word : split_args(arg)) {
        if (word == "-R") {
            entry.direction = ForwardDirection::RemoteToLocal;
        } else if (word == "-L") {
            entry.direction = ForwardDirection::LocalToRemote;
        } else if (word.find(':') != std::string::npos) {
            ports = word;
        } else {
            target = word;
        }
    }

    auto colon = ports.find(':');
    if (colon == std::string::npos) return std::nullopt;
    entry.local_port = safe_stoi(ports.substr(0, colon), -1);
    entry.remote_port = safe_stoi(ports.substr(colon + 1), -1);
    if (entry.local_port <= 0 || entry.remote_port <= 0) return std::nullopt;

    auto profile = cli.resolve_profile(target);
    if (!profile) return std::nullopt;
    entry.profile = *profile;
    return entry;
}

static std::string describe(const PortForwardEntry& e) {
    if (e.direction == ForwardDirection::LocalToRemote) {
        return fmt::format("localhost:{} -> {}:{}", e.local_port, e.profile, e.remote_port);
    }
    return fmt::format("{}:{} -> localhost:{}", e.profile, e.remote_port, e.local_port);
}

static void do_forward(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto entry = parse_forward(cli, arg);
    if (!entry) {
        std::cout << "Usage: forward [-R] <local_port>:<remote_port> [profile]\n";
        return;
    }

    auto result = cli.service->start_forward(*entry);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(result.kind), result.error));
        return;
    }
    std::cout << theme::ok("Forwarding " + describe(*entry));
}

static void do_unforward(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto entry = parse_forward(cli, arg);
    if (!entry) {
        std::cout << "Usage: unforward [-R] <local_port>:<remote_port> [profile]\n";
        return;
    }

    auto result = cli.service->stop_forward(*entry);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(result.kind), result.error));
        return;
    }
    std::cout << theme::ok("Stopped " + describe(*entry));
}

static void do_forwards(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;

    auto entries = cli.service->list_forwards(*profile);
    std::cout << theme::section("Forwards: " + *profile);
    if (entries.empty()) {
        std::cout << theme::dim("    None") << "\n\n";
        return;
    }
    for (const auto& e : entries) {
        std::cout << theme::kv(direction_name(e.direction), describe(e));
    }
    std::cout << "\n";
}

void register_forward_commands(BaseCLI& cli) {
    cli.add_command("forward", do_forward, "Start a port forward ([-R] local:remote [profile])");
    cli.add_command("unforward", do_unforward, "Stop a port forward");
    cli.add_command("forwards", do_forwards, "List active forwards");
}
