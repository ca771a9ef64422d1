#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct SavedCommand {
    std::string name;
    std::string command;
};

// Named commands shared across profiles, kept in insertion order in
// <dir>/saved_commands.yaml as a list of {name, command} maps.
class SavedCommandStore {
public:
    explicit SavedCommandStore(fs::path dir);

    // Empty when the file does not exist yet. ConfigError when it is corrupt.
    Result<std::vector<SavedCommand>> list() const;

    // Adds, or replaces the command of an existing name in place.
    Result<void> save(const std::string& name, const std::string& command);

    // ConfigError for an unknown name.
    Result<void> remove(const std::string& name);
    Result<std::string> find(const std::string& name) const;

    fs::path path() const { return dir_ / "saved_commands.yaml"; }

private:
    fs::path dir_;
    mutable std::mutex mutex_;

    Result<std::vector<SavedCommand>> load() const;
    Result<void> write(const std::vector<SavedCommand>& commands) const;
};
