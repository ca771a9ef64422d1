#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

// Grants the static parsers access to Config's private members.
class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root);
};

Config::Config()
    : profiles_dir_(get_global_config_dir() / "profiles"),
      history_dir_(get_global_config_dir() / "history") {
    dial_.known_hosts_path = (platform::home_dir() / ".ssh" / "known_hosts").string();
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshdeck";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# sshdeck configuration

pool:
  idle_timeout: 300        # seconds before an unused connection is closed
  sweep_interval: 60       # seconds between idle sweeps
  dial_timeout: 10         # seconds for TCP connect + SSH handshake
  keepalive_interval: 30

session:
  stop_grace_ms: 2000      # wait after SIGINT before force-closing

transfer:
  chunk_size: 1048576

forward:
  remote_bind_host: "localhost"

security:
  host_key_policy: "accept_new"   # off | accept_new | strict
  known_hosts: "~/.ssh/known_hosts"

events:
  queue_capacity: 1024
  stall_warn_ms: 500

profiles_dir: "~/.sshdeck/profiles"
history_dir: "~/.sshdeck/history"
# log_file: "/tmp/sshdeck_debug.log"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::Config,
                "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to write config file: " + std::string(e.what()));
    }
}

static Result<void> parse_pool_config(const YAML::Node& node, PoolSettings& pool,
                                      DialSettings& dial) {
    pool.idle_timeout_secs = node["idle_timeout"].as<int>(pool.idle_timeout_secs);
    pool.sweep_interval_secs = node["sweep_interval"].as<int>(pool.sweep_interval_secs);
    dial.dial_timeout_secs = node["dial_timeout"].as<int>(dial.dial_timeout_secs);
    dial.keepalive_secs = node["keepalive_interval"].as<int>(dial.keepalive_secs);

    if (pool.idle_timeout_secs <= 0 || pool.sweep_interval_secs <= 0 ||
        dial.dial_timeout_secs <= 0) {
        return Result<void>::Err(ErrorKind::Config, "pool timeouts must be positive");
    }
    return Result<void>::Ok();
}

static Result<void> parse_security_config(const YAML::Node& node, DialSettings& dial) {
    if (node["host_key_policy"]) {
        auto name = node["host_key_policy"].as<std::string>();
        auto policy = parse_host_key_policy(name);
        if (!policy) {
            return Result<void>::Err(ErrorKind::Config,
                fmt::format("Unknown host_key_policy '{}'", name));
        }
        dial.host_key_policy = *policy;
    }
    if (node["known_hosts"]) {
        dial.known_hosts_path = expand_home(node["known_hosts"].as<std::string>());
    }
    return Result<void>::Ok();
}

Result<Config> ConfigBuilder::build(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return Result<Config>::Ok(config);
    if (!root.IsMap()) {
        return Result<Config>::Err(ErrorKind::Config, "Config root must be a mapping");
    }

    if (root["pool"] && root["pool"].IsMap()) {
        auto r = parse_pool_config(root["pool"], config.pool_, config.dial_);
        if (r.is_err()) return Result<Config>::Err(r);
    }

    if (root["session"] && root["session"].IsMap()) {
        config.session_.stop_grace_ms =
            root["session"]["stop_grace_ms"].as<int>(config.session_.stop_grace_ms);
    }

    if (root["transfer"] && root["transfer"].IsMap()) {
        config.transfer_.chunk_size =
            root["transfer"]["chunk_size"].as<size_t>(config.transfer_.chunk_size);
        if (config.transfer_.chunk_size == 0) {
            return Result<Config>::Err(ErrorKind::Config, "transfer.chunk_size must be positive");
        }
    }

    if (root["forward"] && root["forward"].IsMap()) {
        config.forward_.remote_bind_host =
            root["forward"]["remote_bind_host"].as<std::string>(config.forward_.remote_bind_host);
    }

    if (root["security"] && root["security"].IsMap()) {
        auto r = parse_security_config(root["security"], config.dial_);
        if (r.is_err()) return Result<Config>::Err(r);
    }

    if (root["events"] && root["events"].IsMap()) {
        config.events_.queue_capacity =
            root["events"]["queue_capacity"].as<size_t>(config.events_.queue_capacity);
        config.events_.stall_warn_ms =
            root["events"]["stall_warn_ms"].as<int>(config.events_.stall_warn_ms);
        if (config.events_.queue_capacity == 0) {
            return Result<Config>::Err(ErrorKind::Config, "events.queue_capacity must be positive");
        }
    }

    if (root["profiles_dir"]) {
        config.profiles_dir_ = expand_home(root["profiles_dir"].as<std::string>());
    }
    if (root["history_dir"]) {
        config.history_dir_ = expand_home(root["history_dir"].as<std::string>());
    }
    if (root["log_file"]) {
        config.log_file_ = expand_home(root["log_file"].as<std::string>());
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config,
            "Failed to parse config: " + std::string(e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }
    try {
        return ConfigBuilder::build(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load() {
    return load_file(get_global_config_path());
}
