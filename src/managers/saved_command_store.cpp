#include "saved_command_store.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

SavedCommandStore::SavedCommandStore(fs::path dir) : dir_(std::move(dir)) {}

Result<std::vector<SavedCommand>> SavedCommandStore::load() const {
    using R = Result<std::vector<SavedCommand>>;
    std::vector<SavedCommand> commands;

    std::error_code ec;
    if (!fs::exists(path(), ec)) return R::Ok(commands);

    try {
        YAML::Node root = YAML::LoadFile(path().string());
        if (root.IsNull()) return R::Ok(commands);
        if (!root.IsSequence()) {
            return R::Err(ErrorKind::Config,
                fmt::format("{}: expected a list of saved commands", path().string()));
        }
        for (const auto& node : root) {
            SavedCommand cmd;
            cmd.name = node["name"].as<std::string>("");
            cmd.command = node["command"].as<std::string>("");
            if (cmd.name.empty() || cmd.command.empty()) {
                sshdeck_log(fmt::format("SavedCommandStore: skipping incomplete entry in {}",
                                        path().string()));
                continue;
            }
            commands.push_back(std::move(cmd));
        }
    } catch (const YAML::Exception& e) {
        return R::Err(ErrorKind::Config,
            fmt::format("Failed to parse {}: {}", path().string(), e.what()));
    }
    return R::Ok(commands);
}

Result<void> SavedCommandStore::write(const std::vector<SavedCommand>& commands) const {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& cmd : commands) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << cmd.name;
        out << YAML::Key << "command" << YAML::Value << cmd.command;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::LocalIO,
            fmt::format("Failed to create {}: {}", dir_.string(), ec.message()));
    }
    std::ofstream file(path(), std::ios::trunc);
    if (!file) {
        return Result<void>::Err(ErrorKind::LocalIO, "Failed to write " + path().string());
    }
    file << out.c_str() << "\n";
    return Result<void>::Ok();
}

Result<std::vector<SavedCommand>> SavedCommandStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load();
}

Result<void> SavedCommandStore::save(const std::string& name, const std::string& command) {
    std::string key = trimmed(name);
    std::string line = trimmed(command);
    if (key.empty() || line.empty()) {
        return Result<void>::Err(ErrorKind::Config, "Saved command needs a name and a command");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load();
    if (loaded.is_err()) return Result<void>::Err(loaded);

    auto& commands = loaded.value;
    auto it = std::find_if(commands.begin(), commands.end(),
                           [&](const SavedCommand& c) { return c.name == key; });
    if (it != commands.end()) {
        it->command = line;
    } else {
        commands.push_back(SavedCommand{key, line});
    }
    return write(commands);
}

Result<void> SavedCommandStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load();
    if (loaded.is_err()) return Result<void>::Err(loaded);

    auto& commands = loaded.value;
    auto it = std::find_if(commands.begin(), commands.end(),
                           [&](const SavedCommand& c) { return c.name == name; });
    if (it == commands.end()) {
        return Result<void>::Err(ErrorKind::Config, fmt::format("No saved command named '{}'", name));
    }
    commands.erase(it);
    return write(commands);
}

Result<std::string> SavedCommandStore::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load();
    if (loaded.is_err()) return Result<std::string>::Err(loaded);

    for (const auto& cmd : loaded.value) {
        if (cmd.name == name) return Result<std::string>::Ok(cmd.command);
    }
    return Result<std::string>::Err(ErrorKind::Config,
        fmt::format("No saved command named '{}'", name));
}
