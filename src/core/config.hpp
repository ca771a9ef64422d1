#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.sshdeck/config.yaml (defaults if missing)
    static Result<Config> load();

    // Load from an explicit file (defaults if missing)
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const DialSettings& dial() const { return dial_; }
    const PoolSettings& pool() const { return pool_; }
    const SessionSettings& session() const { return session_; }
    const TransferSettings& transfer() const { return transfer_; }
    const ForwardSettings& forward() const { return forward_; }
    const EventSettings& events() const { return events_; }
    const fs::path& profiles_dir() const { return profiles_dir_; }
    const fs::path& history_dir() const { return history_dir_; }
    const std::string& log_file() const { return log_file_; }

public:
    Config();

private:
    DialSettings dial_;
    PoolSettings pool_;
    SessionSettings session_;
    TransferSettings transfer_;
    ForwardSettings forward_;
    EventSettings events_;
    fs::path profiles_dir_;
    fs::path history_dir_;
    std::string log_file_;

    friend class ConfigBuilder;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
